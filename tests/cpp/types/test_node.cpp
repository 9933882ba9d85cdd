#include <catch2/catch_test_macros.hpp>

#include <kinetic/runtime/reactive_graph.h>
#include <kinetic/types/state.h>

#include <memory>

namespace {
    // Every dependency edge must be mirrored by a dependent edge and the other way round.
    bool edges_symmetric(const kinetic::Node &node) {
        for (const auto &[dependency, _]: node.dependencies()) {
            if (!dependency->has_dependent(node)) { return false; }
        }
        for (auto *dependent: node.dependents()) {
            if (!dependent->depends_on(node)) { return false; }
        }
        return true;
    }
} // namespace

TEST_CASE("Node labels and description", "[node]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto node = graph.create_node(value::Value{3}, "counter");
    REQUIRE(node->label() == "counter");
    REQUIRE_FALSE(node->has_computation());
    REQUIRE(node->graph() == &graph);
    REQUIRE(node->str().find("counter:state=3") != std::string::npos);
    REQUIRE(fmt::format("{}", *node) == node->str());
}

TEST_CASE("Dependency edges are rebuilt on every recompute", "[node]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto flag = make_state(graph, true, "flag");
    auto a = make_state(graph, 1, "a");
    auto b = make_state(graph, 2, "b");
    auto pick = derive<int>(graph, [flag, a, b](ComputeScope &scope) {
        return scope.use(flag) ? scope.use(a) : scope.use(b);
    }, "pick");

    REQUIRE(pick.peek() == 1);
    REQUIRE(pick.node()->depends_on(*a.node()));
    REQUIRE_FALSE(pick.node()->depends_on(*b.node()));
    REQUIRE(a.node()->has_dependent(*pick.node()));

    flag.set(false);
    graph.flush();

    REQUIRE(pick.peek() == 2);
    REQUIRE(pick.node()->depends_on(*b.node()));
    REQUIRE_FALSE(pick.node()->depends_on(*a.node()));
    REQUIRE_FALSE(a.node()->has_dependent(*pick.node()));

    for (const auto *node: {flag.node().get(), a.node().get(), b.node().get(), pick.node().get()}) {
        REQUIRE(edges_symmetric(*node));
    }
}

TEST_CASE("Peeking inside a computation does not create an edge", "[node]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto a = make_state(graph, 1, "a");
    auto b = make_state(graph, 10, "b");
    auto sum = derive<int>(graph, [a, b](ComputeScope &scope) {
        return scope.use(a) + scope.peek(*b.node()).as<int>();
    }, "sum");

    REQUIRE(sum.peek() == 11);
    REQUIRE(sum.node()->depends_on(*a.node()));
    REQUIRE_FALSE(sum.node()->depends_on(*b.node()));

    b.set(20);
    graph.flush();
    REQUIRE(sum.peek() == 11);

    a.set(2);
    graph.flush();
    REQUIRE(sum.peek() == 22);
}

TEST_CASE("Destroying a node removes it from both sides of every edge", "[node]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto a = make_state(graph, 1, "a");
    auto doubled = derive<int>(graph, [a](ComputeScope &scope) { return scope.use(a) * 2; }, "doubled");
    auto tripled = derive<int>(graph, [doubled](ComputeScope &scope) { return scope.use(doubled) + 1; }, "tripled");

    REQUIRE(doubled.node()->has_dependent(*tripled.node()));

    doubled.destroy();

    REQUIRE(doubled.node()->is_destroyed());
    REQUIRE(doubled.node()->graph() == nullptr);
    REQUIRE(doubled.node()->dependencies().empty());
    REQUIRE(doubled.node()->dependents().empty());
    REQUIRE(a.node()->dependents().empty());
    REQUIRE_FALSE(tripled.node()->depends_on(*doubled.node()));
    REQUIRE(edges_symmetric(*a.node()));
    REQUIRE(edges_symmetric(*tripled.node()));

    // Idempotent
    REQUIRE_NOTHROW(graph.destroy(*doubled.node()));
    REQUIRE_THROWS_AS(graph.write(*doubled.node(), value::Value{5}), std::logic_error);
}

TEST_CASE("Dropping the last handle releases the node", "[node]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};

    auto a = make_state(graph, 1, "a");
    REQUIRE(graph.node_count() == 1);
    {
        auto doubled = derive<int>(graph, [a](ComputeScope &scope) { return scope.use(a) * 2; });
        REQUIRE(graph.node_count() == 2);
        REQUIRE(a.node()->dependents().size() == 1);
    }
    REQUIRE(graph.node_count() == 1);
    REQUIRE(graph.memoised_count() == 0);
    REQUIRE(a.node()->dependents().empty());
}

TEST_CASE("Nodes outliving their graph become inert", "[node]") {
    using namespace kinetic;
    node_s_ptr survivor;
    {
        ReactiveGraph graph{GraphConfig{.log_errors = false}};
        survivor = graph.create_node(value::Value{1});
    }
    REQUIRE(survivor->graph() == nullptr);
    REQUIRE(survivor->value().as<int>() == 1);
}
