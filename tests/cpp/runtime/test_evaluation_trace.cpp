#include <catch2/catch_test_macros.hpp>

#include <kinetic/runtime/observers/evaluation_trace.h>
#include <kinetic/runtime/reactive_graph.h>
#include <kinetic/types/state.h>

#include <iostream>
#include <sstream>

namespace {
    struct CaptureStderr {
        CaptureStderr() : _previous{std::cerr.rdbuf(_buffer.rdbuf())} {
        }

        ~CaptureStderr() { std::cerr.rdbuf(_previous); }

        [[nodiscard]] std::string str() const { return _buffer.str(); }

    private:
        std::ostringstream _buffer;
        std::streambuf *_previous;
    };
} // namespace

TEST_CASE("Evaluation trace logs recomputes of matching nodes", "[evaluation_trace]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};
    EvaluationTrace trace{std::string{"sum"}, false};
    EvaluationTrace::set_use_stderr(true);

    auto a = make_state(graph, 1, "a");
    auto other = derive<int>(graph, [a](ComputeScope &scope) { return scope.use(a) - 1; }, "other");
    auto sum = derive<int>(graph, [a](ComputeScope &scope) { return scope.use(a) + 1; }, "sum");

    graph.add_observer(&trace);
    std::string output;
    {
        CaptureStderr capture;
        a.set(2);
        graph.flush();
        output = capture.str();
    }
    graph.remove_observer(&trace);

    REQUIRE(output.find("[sum] recomputing") != std::string::npos);
    REQUIRE(output.find("[sum] changed -> 3") != std::string::npos);
    REQUIRE(output.find("[other]") == std::string::npos);
    REQUIRE(output.find("flush") == std::string::npos);
}

TEST_CASE("Evaluation trace reports contained failures", "[evaluation_trace]") {
    using namespace kinetic;
    ReactiveGraph graph{GraphConfig{.log_errors = false}};
    EvaluationTrace trace;
    graph.add_observer(&trace);

    std::string output;
    {
        CaptureStderr capture;
        auto broken = derive<int>(graph, [](ComputeScope &) -> int { throw std::runtime_error("boom"); }, "broken");
        output = capture.str();
    }
    graph.remove_observer(&trace);

    REQUIRE(output.find("[broken] computation failed: boom") != std::string::npos);
}
