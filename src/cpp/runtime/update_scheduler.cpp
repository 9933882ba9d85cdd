#include <kinetic/runtime/reactive_graph.h>
#include <kinetic/runtime/update_scheduler.h>
#include <kinetic/util/scope.h>

#include <vector>

namespace kinetic {
    UpdateScheduler::UpdateScheduler(ReactiveGraph &graph, UpdateMode mode) : _graph{graph}, _mode{mode} {
    }

    void UpdateScheduler::enqueue(Node &node, UpdateFlags flags) {
        if (node.is_destroyed()) { return; }
        if (auto it = _pending.find(&node); it != _pending.end()) {
            it->second = it->second.merged(flags);
        } else {
            _pending.emplace(&node, flags);
        }
        if (_mode == UpdateMode::IMMEDIATE) { flush(); }
    }

    void UpdateScheduler::cancel(const Node &node) { _pending.erase(const_cast<node_ptr>(&node)); }

    bool UpdateScheduler::is_pending(const Node &node) const {
        return _pending.contains(const_cast<node_ptr>(&node));
    }

    const UpdateFlags *UpdateScheduler::pending_flags(const Node &node) const {
        auto it = _pending.find(const_cast<node_ptr>(&node));
        return it == _pending.end() ? nullptr : &it->second;
    }

    void UpdateScheduler::set_mode(UpdateMode mode) {
        _mode = mode;
        if (_mode == UpdateMode::IMMEDIATE) { flush(); }
    }

    dense_set<node_ptr> UpdateScheduler::downstream_of_pending(const dense_set<node_ptr> &settled) const {
        dense_set<node_ptr> reached;
        dense_set<node_ptr> expanded;
        std::vector<node_ptr> frontier;
        for (const auto &[node, _]: _pending) {
            if (!settled.contains(node)) { frontier.push_back(node); }
        }
        while (!frontier.empty()) {
            auto *node = frontier.back();
            frontier.pop_back();
            if (!expanded.insert(node).second) { continue; }
            for (auto *dependent: node->dependents()) {
                // A settled node will not change again in this flush, nothing flows through it
                if (settled.contains(dependent)) { continue; }
                reached.insert(dependent);
                frontier.push_back(dependent);
            }
        }
        return reached;
    }

    bool UpdateScheduler::has_pending_dependency(const Node &node, const dense_set<node_ptr> &settled) const {
        for (const auto &[dependency, _]: node.dependencies()) {
            if (_pending.contains(dependency) && !settled.contains(dependency)) { return true; }
        }
        return false;
    }

    size_t UpdateScheduler::flush() {
        if (_flushing || _pending.empty()) { return 0; }

        FlagGuard guard{_flushing};
        _graph.notify_observers([this](GraphObserver &o) { o.on_before_flush(_graph, _pending.size()); });

        // Written nodes are applied at most once per flush, a write arriving after that stays pending for the next
        // flush. This bounds the work done here even when connections feed values back into their own inputs.
        dense_set<node_ptr> settled;
        size_t count{0};

        auto apply = [this, &settled, &count](node_ptr node, UpdateFlags flags) {
            if (!flags.from_dependency) { settled.insert(node); }
            ++count;
            _graph.apply_update(*node, flags);
        };

        while (true) {
            std::vector<node_ptr> candidates;
            candidates.reserve(_pending.size());
            for (const auto &[node, _]: _pending) {
                if (!settled.contains(node)) { candidates.push_back(node); }
            }
            if (candidates.empty()) { break; }

            const auto blocked = downstream_of_pending(settled);
            bool progressed{false};
            node_ptr first_blocked{nullptr};
            for (auto *node: candidates) {
                auto it = _pending.find(node);
                // Cancelled (destroyed) or settled by a nested operation during this pass
                if (it == _pending.end() || settled.contains(node)) { continue; }
                // Direct check catches roots written by connections fired earlier in this pass
                if (blocked.contains(node) || has_pending_dependency(*node, settled)) {
                    if (first_blocked == nullptr) { first_blocked = node; }
                    continue;
                }
                auto flags = it->second;
                _pending.erase(it);
                progressed = true;
                apply(node, flags);
            }

            if (!progressed && first_blocked != nullptr) {
                // Every remaining node waits on another pending node, only a dependency cycle can do that
                auto it = _pending.find(first_blocked);
                if (it == _pending.end()) { continue; }
                auto flags = it->second;
                _pending.erase(it);
                settled.insert(first_blocked);
                _graph.report_dependency_cycle(*first_blocked);
                apply(first_blocked, flags);
            }
        }

        _graph.notify_observers([this, count](GraphObserver &o) { o.on_after_flush(_graph, count); });
        return count;
    }
} // namespace kinetic
