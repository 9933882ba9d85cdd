#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <kinetic/animation/easing.h>

#include <string>

TEST_CASE("Every easing curve is anchored at both ends", "[easing]") {
    using namespace kinetic;
    for (auto style: {EasingStyle::LINEAR, EasingStyle::QUAD, EasingStyle::CUBIC, EasingStyle::QUART,
                      EasingStyle::QUINT, EasingStyle::SINE, EasingStyle::EXPONENTIAL, EasingStyle::CIRCULAR,
                      EasingStyle::BACK, EasingStyle::ELASTIC, EasingStyle::BOUNCE}) {
        for (auto direction: {EasingDirection::IN, EasingDirection::OUT, EasingDirection::IN_OUT}) {
            INFO(to_string(style) << " " << to_string(direction));
            REQUIRE(ease(style, direction, 0.0) == 0.0);
            REQUIRE(ease(style, direction, 1.0) == 1.0);
        }
    }
}

TEST_CASE("Easing directions are derived from the in curve", "[easing]") {
    using namespace kinetic;
    REQUIRE(ease(EasingStyle::LINEAR, EasingDirection::IN, 0.3) == Catch::Approx(0.3));
    REQUIRE(ease(EasingStyle::QUAD, EasingDirection::IN, 0.5) == Catch::Approx(0.25));
    REQUIRE(ease(EasingStyle::QUAD, EasingDirection::OUT, 0.5) == Catch::Approx(0.75));
    REQUIRE(ease(EasingStyle::QUAD, EasingDirection::IN_OUT, 0.25) == Catch::Approx(0.125));
    REQUIRE(ease(EasingStyle::QUAD, EasingDirection::IN_OUT, 0.5) == Catch::Approx(0.5));
    REQUIRE(ease(EasingStyle::CUBIC, EasingDirection::IN_OUT, 0.75) == Catch::Approx(0.9375));

    // Back pulls below zero before heading for the target
    REQUIRE(ease(EasingStyle::BACK, EasingDirection::IN, 0.2) < 0.0);
    REQUIRE(ease(EasingStyle::BACK, EasingDirection::OUT, 0.8) > 1.0);

    // Outside the unit interval the curve is clamped
    REQUIRE(ease(EasingStyle::QUAD, EasingDirection::IN, 1.5) == 1.0);
    REQUIRE(ease(EasingStyle::QUAD, EasingDirection::IN, -0.5) == 0.0);
}

TEST_CASE("Easing names", "[easing]") {
    using namespace kinetic;
    REQUIRE(std::string{to_string(EasingStyle::ELASTIC)} == "Elastic");
    REQUIRE(std::string{to_string(EasingDirection::IN_OUT)} == "InOut");
}
