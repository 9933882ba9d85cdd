#include <kinetic/animation/animation_driver.h>
#include <kinetic/runtime/reactive_graph.h>
#include <kinetic/types/node.h>

namespace kinetic {
    Node::Node(Key, ReactiveGraph *graph, value::Value initial, std::string label)
        : _graph{graph}, _value{std::move(initial)}, _label{std::move(label)} {
    }

    Node::~Node() {
        if (_graph != nullptr) {
            _graph->release(*this);
            return;
        }
        // Detached from its graph (or already destroyed), only the dependent index of our dependencies remains.
        for (auto &[dependency, _]: _dependencies) { dependency->_dependents.erase(this); }
    }

    bool Node::depends_on(const Node &other) const { return _dependencies.contains(const_cast<node_ptr>(&other)); }

    bool Node::has_dependent(const Node &other) const { return _dependents.contains(const_cast<node_ptr>(&other)); }

    std::string Node::str() const {
        return fmt::format("Node@{:p}[{}{}{}={}]", static_cast<const void *>(this), _label.empty() ? "" : _label,
                           _label.empty() ? "" : ":", _computation ? "computed" : "state", _value.to_string());
    }
} // namespace kinetic
