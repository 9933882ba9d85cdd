#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <kinetic/animation/spring.h>
#include <kinetic/runtime/reactive_graph.h>
#include <kinetic/types/state.h>

#include <array>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace {
    constexpr kinetic::tick_delta_t FRAME{1.0 / 60.0};

    struct FaultCounter : kinetic::GraphObserver {
        int faults{0};
        std::vector<std::string> animation_errors;

        void on_spring_fault(const kinetic::Node &, size_t) override { ++faults; }

        void on_animation_error(const kinetic::Node &, std::string_view message) override {
            animation_errors.emplace_back(message);
        }
    };
} // namespace

TEST_CASE("Spring coefficients", "[spring]") {
    using namespace kinetic;

    for (double damping: {0.5, 1.0, 2.0}) {
        auto c = spring_coefficients(0.0, damping, 10.0);
        REQUIRE(c.pos_pos == 1.0);
        REQUIRE(c.pos_vel == 0.0);
        REQUIRE(c.vel_pos == 0.0);
        REQUIRE(c.vel_vel == 1.0);
    }

    auto frozen = spring_coefficients(1.0, 1.0, 0.0);
    REQUIRE(frozen.pos_pos == 1.0);
    REQUIRE(frozen.vel_vel == 1.0);

    // Every regime decays towards rest
    for (double damping: {0.3, 1.0, 3.0}) {
        auto c = spring_coefficients(5.0, damping, 10.0);
        REQUIRE(std::abs(c.pos_pos) < 1e-3);
        REQUIRE(std::abs(c.vel_vel) < 1e-3);
    }

    // The regimes agree as damping approaches critical
    auto under = spring_coefficients(0.1, 0.999999, 10.0);
    auto critical = spring_coefficients(0.1, 1.0, 10.0);
    auto over = spring_coefficients(0.1, 1.000001, 10.0);
    REQUIRE(under.pos_pos == Catch::Approx(critical.pos_pos).epsilon(1e-4));
    REQUIRE(over.pos_pos == Catch::Approx(critical.pos_pos).epsilon(1e-4));
    REQUIRE(over.vel_pos == Catch::Approx(critical.vel_pos).epsilon(1e-4));
}

TEST_CASE("A critically damped spring settles exactly on its goal", "[spring]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto x = make_state(graph, 0.0, "x");
    auto &spring = x.spring();
    REQUIRE_FALSE(spring.is_animating());

    x.set(1.0);
    REQUIRE(spring.is_animating());
    REQUIRE(x.peek() == 0.0);

    double previous = x.peek();
    for (int frame = 0; frame < 300; ++frame) {
        graph.tick(FRAME);
        REQUIRE(x.peek() >= previous);
        REQUIRE(x.peek() <= 1.0);
        previous = x.peek();
    }

    REQUIRE_FALSE(spring.is_animating());
    REQUIRE(x.peek() == 1.0);
}

TEST_CASE("Retargeting a moving spring keeps position and velocity", "[spring]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto x = make_state(graph, 0.0, "x");
    auto &spring = x.spring(SpringOptions{.damping = 0.5});
    x.set(10.0);
    for (int frame = 0; frame < 10; ++frame) { graph.tick(FRAME); }

    auto [position, velocity] = spring.state_at(graph.now());
    REQUIRE(velocity[0] > 0.0);

    x.set(-5.0);
    REQUIRE(spring.start_position() == position);
    REQUIRE(spring.start_velocity() == velocity);
    REQUIRE(spring.origin() == graph.now());
    REQUIRE(spring.target() == channel_vector{-5.0});

    // Still heading up for a moment before turning around
    graph.tick(FRAME);
    REQUIRE(x.peek() > position[0]);

    for (int frame = 0; frame < 600; ++frame) { graph.tick(FRAME); }
    REQUIRE(x.peek() == -5.0);
}

TEST_CASE("A change of value type snaps instead of animating", "[spring]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto node = graph.create_node(value::Value{0.0}, "mixed");
    auto &spring = graph.attach_spring(*node);
    graph.write(*node, value::Value{3});

    REQUIRE(node->value().is<int>());
    REQUIRE(node->value().as<int>() == 3);
    REQUIRE_FALSE(spring.is_animating());

    auto text = graph.create_node(value::Value{std::string{"a"}});
    REQUIRE_THROWS_AS(graph.attach_spring(*text), std::invalid_argument);
}

TEST_CASE("A non finite spring state resets the channel", "[spring]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};
    FaultCounter observer;
    graph.add_observer(&observer);

    auto x = make_state(graph, 2.0, "x");
    auto &spring = x.spring();
    spring.set_velocity(graph, *x.node(), value::Value{std::numeric_limits<double>::infinity()});
    REQUIRE(spring.is_animating());

    graph.tick(FRAME);

    REQUIRE(observer.faults == 1);
    REQUIRE(x.peek() == 2.0);
    REQUIRE_FALSE(spring.is_animating());
    graph.remove_observer(&observer);
}

TEST_CASE("Impulses move a resting spring and it returns", "[spring]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto x = make_state(graph, 0.0, "x");
    auto &spring = x.spring();

    spring.set_velocity(graph, *x.node(), value::Value{5.0});
    graph.tick(FRAME);
    REQUIRE(x.peek() > 0.0);

    spring.add_velocity(graph, *x.node(), value::Value{5.0});
    REQUIRE(spring.start_velocity()[0] > 5.0);

    for (int frame = 0; frame < 300; ++frame) { graph.tick(FRAME); }
    REQUIRE(x.peek() == 0.0);

    spring.set_position(graph, *x.node(), value::Value{4.0});
    REQUIRE(x.peek() == 4.0);
    REQUIRE(spring.is_animating());
    REQUIRE_THROWS_AS(spring.set_position(graph, *x.node(), value::Value{4}), std::invalid_argument);
}

TEST_CASE("Spring parameters can come from other nodes", "[spring]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto speed = make_state(graph, 0.0, "speed");
    auto goal = make_state(graph, std::array<double, 2>{1.0, -1.0}, "goal");
    auto position = make_state(graph, std::array<double, 2>{0.0, 0.0}, "position");
    auto &spring = position.spring(SpringOptions{.goal = goal.node(), .speed = speed.node()});

    // Attaching snaps onto the sampled goal
    REQUIRE(position.peek() == std::array<double, 2>{1.0, -1.0});
    REQUIRE_FALSE(spring.is_animating());

    goal.set(std::array<double, 2>{3.0, 3.0});
    graph.tick(FRAME);
    REQUIRE(spring.is_animating());
    // Zero speed holds the spring still
    REQUIRE(position.peek() == std::array<double, 2>{1.0, -1.0});

    speed.set(20.0);
    for (int frame = 0; frame < 300; ++frame) { graph.tick(FRAME); }
    REQUIRE(position.peek() == std::array<double, 2>{3.0, 3.0});
    REQUIRE(spring.speed() == 20.0);

    // Reads of the goal and speed never become dependency edges
    REQUIRE(position.node()->dependencies().empty());
    REQUIRE(goal.node()->dependents().empty());
}

TEST_CASE("A spring parameter that stops being numeric does not stall the tick", "[spring]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};
    FaultCounter observer;
    graph.add_observer(&observer);

    auto speed = make_state(graph, 10.0, "speed");
    auto x = make_state(graph, 0.0, "x");
    auto &spring = x.spring(SpringOptions{.speed = speed.node()});
    auto a = make_state(graph, 0, "a");
    auto twice = derive<int>(graph, [a](ComputeScope &scope) { return scope.use(a) * 2; }, "twice");

    x.set(1.0);
    graph.tick(FRAME);
    const double moved = x.peek();
    REQUIRE(moved > 0.0);

    graph.write(*speed.node(), value::Value{std::string{"fast"}});
    a.set(5);
    for (int frame = 0; frame < 3; ++frame) { REQUIRE_NOTHROW(graph.tick(FRAME)); }

    // Unrelated nodes still propagate and the spring keeps its last valid speed
    REQUIRE(twice.peek() == 10);
    REQUIRE(graph.scheduler().pending_count() == 0);
    REQUIRE(observer.animation_errors.size() == 3);
    REQUIRE(spring.speed() == 10.0);
    REQUIRE(x.peek() > moved);

    speed.set(20.0);
    graph.tick(FRAME);
    REQUIRE(spring.speed() == 20.0);
    REQUIRE(observer.animation_errors.size() == 3);
    graph.remove_observer(&observer);
}
