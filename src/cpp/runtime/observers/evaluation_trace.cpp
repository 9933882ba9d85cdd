#include <kinetic/runtime/observers/evaluation_trace.h>
#include <kinetic/runtime/reactive_graph.h>

#include <fmt/format.h>

#include <iostream>

namespace kinetic {

    // Static member initialization
    bool EvaluationTrace::_print_all_values = false;
    bool EvaluationTrace::_use_stderr = true;

    EvaluationTrace::EvaluationTrace(const std::optional<std::string> &filter, bool flush, bool recompute,
                                     bool errors)
        : _filter(filter), _flush(flush), _recompute(recompute), _errors(errors) {
    }

    void EvaluationTrace::set_print_all_values(bool value) { _print_all_values = value; }

    void EvaluationTrace::set_use_stderr(bool value) { _use_stderr = value; }

    void EvaluationTrace::_print(const std::string &msg) const {
        if (_use_stderr) {
            std::cerr << "[kinetic] " << msg << std::endl;
        } else {
            std::cout << "[kinetic] " << msg << std::endl;
        }
    }

    void EvaluationTrace::_print_node(const Node &node, const std::string &msg, bool add_value) const {
        auto name = node.label().empty() ? fmt::format("{:p}", static_cast<const void *>(&node)) : node.label();
        if (add_value || _print_all_values) {
            _print(fmt::format("[{}] {} -> {}", name, msg, node.value()));
        } else {
            _print(fmt::format("[{}] {}", name, msg));
        }
    }

    bool EvaluationTrace::_should_log_node(const Node &node) const {
        if (!_filter.has_value()) { return true; }
        return node.label().find(*_filter) != std::string::npos;
    }

    void EvaluationTrace::on_before_flush(const ReactiveGraph &graph, size_t pending) {
        if (!_flush) { return; }
        _print(fmt::format("{:.4f}s flush: {} pending", graph.now().count(), pending));
    }

    void EvaluationTrace::on_after_flush(const ReactiveGraph &graph, size_t applied) {
        if (!_flush) { return; }
        _print(fmt::format("{:.4f}s flush done: {} applied, {} left over", graph.now().count(), applied,
                           graph.scheduler().pending_count()));
    }

    void EvaluationTrace::on_before_recompute(const Node &node) {
        if (!_recompute || !_should_log_node(node)) { return; }
        _print_node(node, "recomputing");
    }

    void EvaluationTrace::on_after_recompute(const Node &node, bool changed) {
        if (!_recompute || !_should_log_node(node)) { return; }
        _print_node(node, changed ? "changed" : "unchanged", changed);
    }

    void EvaluationTrace::on_computation_error(const Node &node, std::string_view message) {
        if (!_errors || !_should_log_node(node)) { return; }
        _print_node(node, fmt::format("computation failed: {}", message));
    }

    void EvaluationTrace::on_connection_error(const Node &node, std::string_view message) {
        if (!_errors || !_should_log_node(node)) { return; }
        _print_node(node, fmt::format("connection failed: {}", message));
    }

    void EvaluationTrace::on_dependency_cycle(const Node &node) {
        if (!_errors || !_should_log_node(node)) { return; }
        _print_node(node, "dependency cycle, applied out of order");
    }

    void EvaluationTrace::on_spring_fault(const Node &node, size_t channel) {
        if (!_errors || !_should_log_node(node)) { return; }
        _print_node(node, fmt::format("spring fault on channel {}", channel));
    }

    void EvaluationTrace::on_animation_error(const Node &node, std::string_view message) {
        if (!_errors || !_should_log_node(node)) { return; }
        _print_node(node, fmt::format("animation failed: {}", message));
    }

    void EvaluationTrace::on_node_destroyed(const Node &node) {
        if (!_recompute || !_should_log_node(node)) { return; }
        _print_node(node, "destroyed");
    }

} // namespace kinetic
