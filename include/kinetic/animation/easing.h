#ifndef KINETIC_EASING_H
#define KINETIC_EASING_H

#include <kinetic/kinetic_export.h>

#include <cstdint>

namespace kinetic {

    enum class EasingStyle : uint8_t {
        LINEAR,
        QUAD,
        CUBIC,
        QUART,
        QUINT,
        SINE,
        EXPONENTIAL,
        CIRCULAR,
        BACK,
        ELASTIC,
        BOUNCE
    };

    enum class EasingDirection : uint8_t { IN, OUT, IN_OUT };

    /**
     * Maps alpha in [0, 1] to an interpolation parameter. Every curve maps 0 to 0 and 1 to 1; Back and Elastic
     * overshoot in between.
     */
    [[nodiscard]] KINETIC_EXPORT double ease(EasingStyle style, EasingDirection direction, double alpha);

    [[nodiscard]] KINETIC_EXPORT const char *to_string(EasingStyle style);

    [[nodiscard]] KINETIC_EXPORT const char *to_string(EasingDirection direction);

} // namespace kinetic

#endif // KINETIC_EASING_H
