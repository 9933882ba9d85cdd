#include <kinetic/animation/easing.h>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace kinetic {
    namespace {
        constexpr double BACK_C1 = 1.70158;
        constexpr double BACK_C3 = BACK_C1 + 1.0;
        constexpr double ELASTIC_C4 = 2.0 * std::numbers::pi / 3.0;

        double bounce_out(double t) {
            constexpr double n1 = 7.5625;
            constexpr double d1 = 2.75;
            if (t < 1.0 / d1) { return n1 * t * t; }
            if (t < 2.0 / d1) {
                t -= 1.5 / d1;
                return n1 * t * t + 0.75;
            }
            if (t < 2.5 / d1) {
                t -= 2.25 / d1;
                return n1 * t * t + 0.9375;
            }
            t -= 2.625 / d1;
            return n1 * t * t + 0.984375;
        }

        // The "in" form of every curve, the other directions are derived from it.
        double ease_in(EasingStyle style, double t) {
            switch (style) {
                case EasingStyle::LINEAR: return t;
                case EasingStyle::QUAD: return t * t;
                case EasingStyle::CUBIC: return t * t * t;
                case EasingStyle::QUART: return t * t * t * t;
                case EasingStyle::QUINT: return t * t * t * t * t;
                case EasingStyle::SINE: return 1.0 - std::cos(t * std::numbers::pi / 2.0);
                case EasingStyle::EXPONENTIAL: return t <= 0.0 ? 0.0 : std::pow(2.0, 10.0 * t - 10.0);
                case EasingStyle::CIRCULAR: return 1.0 - std::sqrt(std::max(0.0, 1.0 - t * t));
                case EasingStyle::BACK: return BACK_C3 * t * t * t - BACK_C1 * t * t;
                case EasingStyle::ELASTIC:
                    if (t <= 0.0 || t >= 1.0) { return t <= 0.0 ? 0.0 : 1.0; }
                    return -std::pow(2.0, 10.0 * t - 10.0) * std::sin((t * 10.0 - 10.75) * ELASTIC_C4);
                case EasingStyle::BOUNCE: return 1.0 - bounce_out(1.0 - t);
            }
            return t;
        }
    } // namespace

    double ease(EasingStyle style, EasingDirection direction, double alpha) {
        const double t = std::clamp(alpha, 0.0, 1.0);
        // Exact endpoints, the exponential curve would otherwise land a hair off 1
        if (t <= 0.0) { return 0.0; }
        if (t >= 1.0) { return 1.0; }
        switch (direction) {
            case EasingDirection::IN: return ease_in(style, t);
            case EasingDirection::OUT: return 1.0 - ease_in(style, 1.0 - t);
            case EasingDirection::IN_OUT:
                return t < 0.5 ? ease_in(style, 2.0 * t) / 2.0 : 1.0 - ease_in(style, 2.0 - 2.0 * t) / 2.0;
        }
        return t;
    }

    const char *to_string(EasingStyle style) {
        switch (style) {
            case EasingStyle::LINEAR: return "Linear";
            case EasingStyle::QUAD: return "Quad";
            case EasingStyle::CUBIC: return "Cubic";
            case EasingStyle::QUART: return "Quart";
            case EasingStyle::QUINT: return "Quint";
            case EasingStyle::SINE: return "Sine";
            case EasingStyle::EXPONENTIAL: return "Exponential";
            case EasingStyle::CIRCULAR: return "Circular";
            case EasingStyle::BACK: return "Back";
            case EasingStyle::ELASTIC: return "Elastic";
            case EasingStyle::BOUNCE: return "Bounce";
        }
        return "Unknown";
    }

    const char *to_string(EasingDirection direction) {
        switch (direction) {
            case EasingDirection::IN: return "In";
            case EasingDirection::OUT: return "Out";
            case EasingDirection::IN_OUT: return "InOut";
        }
        return "Unknown";
    }
} // namespace kinetic
