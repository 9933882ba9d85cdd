#ifndef KINETIC_TWEEN_H
#define KINETIC_TWEEN_H

#include <kinetic/animation/animation_driver.h>
#include <kinetic/animation/easing.h>

namespace kinetic {

    struct TweenProfile {
        tick_delta_t duration{1.0};
        tick_delta_t delay{0.0};
        EasingStyle style{EasingStyle::QUAD};
        EasingDirection direction{EasingDirection::OUT};
        // Plays forwards then backwards within each repetition, finishing back at the start value.
        bool reverses{false};
        // Extra repetitions after the first play, negative repeats forever.
        int repeat_count{0};
    };

    /**
     * Eased, time based interpolation from the node's value at the time of the write towards the written value.
     */
    class KINETIC_EXPORT TweenDriver final : public AnimationDriver {
    public:
        explicit TweenDriver(TweenProfile profile);

        void on_write(ReactiveGraph &graph, Node &node, value::Value goal) override;

        void step(ReactiveGraph &graph, Node &node, tick_time_t now) override;

        [[nodiscard]] bool is_animating() const override { return _origin.has_value(); }

        [[nodiscard]] const char *kind() const override { return "tween"; }

        [[nodiscard]] const TweenProfile &profile() const { return _profile; }

        [[nodiscard]] const value::Value &start() const { return _start; }

        [[nodiscard]] const value::Value &goal() const { return _goal; }

        [[nodiscard]] int repeats_left() const { return _repeats_left; }

    private:
        TweenProfile _profile;
        value::Value _start;
        value::Value _goal;
        tick_origin_t _origin;
        int _repeats_left{0};
    };

} // namespace kinetic

#endif // KINETIC_TWEEN_H
