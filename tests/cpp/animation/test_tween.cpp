#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <kinetic/animation/tween.h>
#include <kinetic/runtime/reactive_graph.h>
#include <kinetic/types/state.h>

#include <vector>

namespace {
    constexpr kinetic::tick_delta_t QUARTER{0.25};
}

TEST_CASE("A reversing tween with one repeat", "[tween]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto x = make_state(graph, 0.0, "x");
    auto &tween = x.tween(TweenProfile{.duration = tick_delta_t{1.0}, .style = EasingStyle::LINEAR,
                                       .reverses = true, .repeat_count = 1});
    x.set(1.0);
    REQUIRE(tween.is_animating());
    REQUIRE(x.peek() == 0.0);

    std::vector<double> seen;
    for (int i = 0; i < 16; ++i) {
        graph.tick(QUARTER);
        seen.push_back(x.peek());
    }

    const std::vector<double> expected{0.25, 0.5, 0.75, 1.0, 0.75, 0.5, 0.25, 0.0,
                                       0.25, 0.5, 0.75, 1.0, 0.75, 0.5, 0.25, 0.0};
    REQUIRE(seen.size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        INFO("tick " << i);
        REQUIRE(seen[i] == Catch::Approx(expected[i]));
    }
    REQUIRE_FALSE(tween.is_animating());
    REQUIRE(tween.repeats_left() == 0);
}

TEST_CASE("A repeating tween only reaches its goal when it finishes", "[tween]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto x = make_state(graph, 0.0, "x");
    auto &tween = x.tween(TweenProfile{.duration = tick_delta_t{0.5}, .style = EasingStyle::LINEAR,
                                       .repeat_count = 1});
    x.set(1.0);

    std::vector<double> seen;
    for (int i = 0; i < 4; ++i) {
        graph.tick(QUARTER);
        seen.push_back(x.peek());
    }

    REQUIRE(seen == std::vector<double>{0.5, 0.0, 0.5, 1.0});
    REQUIRE_FALSE(tween.is_animating());
}

TEST_CASE("A delayed tween holds its start value", "[tween]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto x = make_state(graph, 0.0, "x");
    x.tween(TweenProfile{.duration = tick_delta_t{1.0}, .delay = tick_delta_t{0.5}, .style = EasingStyle::LINEAR});
    x.set(2.0);

    graph.tick(QUARTER);
    REQUIRE(x.peek() == 0.0);
    graph.tick(QUARTER);
    REQUIRE(x.peek() == 0.0);
    graph.tick(QUARTER);
    REQUIRE(x.peek() == Catch::Approx(0.5));
    for (int i = 0; i < 3; ++i) { graph.tick(QUARTER); }
    REQUIRE(x.peek() == 2.0);
}

TEST_CASE("Tween edge cases", "[tween]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    SECTION("zero duration completes on the first tick") {
        auto x = make_state(graph, 0.0, "x");
        auto &tween = x.tween(TweenProfile{.duration = tick_delta_t{0.0}});
        x.set(5.0);
        graph.tick(QUARTER);
        REQUIRE(x.peek() == 5.0);
        REQUIRE_FALSE(tween.is_animating());
    }

    SECTION("writes that skip animation assign directly") {
        auto x = make_state(graph, 0.0, "x");
        auto &tween = x.tween(TweenProfile{});
        x.set(3.0, WriteOptions{.skip_animation = true});
        REQUIRE(x.peek() == 3.0);
        REQUIRE_FALSE(tween.is_animating());
    }

    SECTION("interrupting starts from the current value") {
        auto x = make_state(graph, 0.0, "x");
        auto &tween = x.tween(TweenProfile{.duration = tick_delta_t{1.0}, .style = EasingStyle::LINEAR});
        x.set(4.0);
        graph.tick(QUARTER);
        x.set(0.0);
        REQUIRE(tween.start().as<double>() == Catch::Approx(1.0));
        REQUIRE(tween.goal().as<double>() == 0.0);
    }

    SECTION("infinite repeats keep running") {
        auto x = make_state(graph, 0.0, "x");
        auto &tween = x.tween(TweenProfile{.duration = tick_delta_t{0.5}, .style = EasingStyle::LINEAR,
                                           .repeat_count = -1});
        x.set(1.0);
        for (int i = 0; i < 40; ++i) { graph.tick(QUARTER); }
        REQUIRE(tween.is_animating());
    }

    SECTION("negative durations are rejected") {
        auto x = make_state(graph, 0.0, "x");
        REQUIRE_THROWS_AS(x.tween(TweenProfile{.duration = tick_delta_t{-1.0}}), std::invalid_argument);
    }

    SECTION("dependents follow the animated value") {
        auto x = make_state(graph, 0, "x");
        auto doubled = derive<int>(graph, [x](ComputeScope &scope) { return scope.use(x) * 2; }, "doubled");
        x.tween(TweenProfile{.duration = tick_delta_t{1.0}, .style = EasingStyle::LINEAR});
        x.set(10);
        graph.tick(QUARTER);
        REQUIRE(x.peek() == 3);
        REQUIRE(doubled.peek() == 6);
    }
}
