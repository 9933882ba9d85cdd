#include <kinetic/runtime/reactive_graph.h>
#include <kinetic/types/computation.h>
#include <kinetic/util/errors.h>

namespace kinetic {
    Computation::Computation(body_type body, std::string label, discard_type on_discard)
        : _body{std::move(body)}, _label{std::move(label)}, _on_discard{std::move(on_discard)} {
        if (!_body) { throw_error<std::invalid_argument>("Computation '{}' requires a body", _label); }
    }

    value::Value Computation::evaluate(ComputeScope &scope) const { return _body(scope); }

    void Computation::discard(const value::Value &old_value) const {
        if (_on_discard && old_value.has_value()) { _on_discard(old_value); }
    }

    ComputeScope::ComputeScope(ReactiveGraph &graph, Node &node) : _graph{graph}, _node{node} {
    }

    const value::Value &ComputeScope::use(Node &dependency) { return _graph.read(dependency); }

    const value::Value &ComputeScope::peek(const Node &node) const { return _graph.peek(node); }
} // namespace kinetic
