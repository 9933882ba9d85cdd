#ifndef KINETIC_DATE_TIME_H
#define KINETIC_DATE_TIME_H

#include <chrono>
#include <optional>

namespace kinetic {
    // Animation time is measured in (fractional) seconds since the graph was created. The physics and easing
    // maths all work in double precision seconds, so a floating point duration avoids repeated conversions.
    using tick_delta_t = std::chrono::duration<double>;
    using tick_time_t = std::chrono::duration<double>;

    constexpr tick_time_t min_tick_time() noexcept { return tick_time_t{0.0}; }

    inline constexpr auto MIN_TT = min_tick_time();

    // Origin of a running animation; empty while the animation is at rest.
    using tick_origin_t = std::optional<tick_time_t>;

    /**
     * Monotonic clock advanced by the externally supplied periodic tick.
     */
    class TickClock {
    public:
        [[nodiscard]] tick_time_t now() const noexcept { return _now; }

        void advance(tick_delta_t dt) noexcept {
            // Negative deltas would run springs backwards, treat them as a zero length tick
            if (dt.count() > 0.0) { _now += dt; }
        }

    private:
        tick_time_t _now{MIN_TT};
    };
} // namespace kinetic
#endif  // KINETIC_DATE_TIME_H
