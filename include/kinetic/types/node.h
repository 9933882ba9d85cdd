#ifndef KINETIC_NODE_H
#define KINETIC_NODE_H

#include <kinetic/kinetic_base.h>
#include <kinetic/types/computation.h>
#include <kinetic/types/connection.h>
#include <kinetic/types/value/value.h>

#include <memory>
#include <string>

namespace kinetic {

    /**
     * A reactive cell: the current value plus its dependency edges.
     *
     * Ownership follows the dependency direction only. A node keeps a strong reference to every node it read
     * during its last computation, while the reverse dependent link is a raw pointer index that never extends
     * the lifetime of the dependency. The dependent index is pruned when the dependent is destroyed.
     *
     * All mutation goes through the owning ReactiveGraph, the node itself is a passive data holder.
     */
    struct KINETIC_EXPORT Node : std::enable_shared_from_this<Node> {
        using ptr = node_s_ptr;
        using dependency_map = dense_map<node_ptr, node_s_ptr>;
        using dependent_set = dense_set<node_ptr>;

        class Key {
            Key() = default;
            friend class ReactiveGraph;
        };

        Node(Key, ReactiveGraph *graph, value::Value initial, std::string label);

        Node(const Node &) = delete;

        Node &operator=(const Node &) = delete;

        ~Node();

        [[nodiscard]] const value::Value &value() const { return _value; }

        [[nodiscard]] bool has_computation() const { return _computation != nullptr; }

        [[nodiscard]] const Computation::ptr &computation() const { return _computation; }

        [[nodiscard]] const dependency_map &dependencies() const { return _dependencies; }

        [[nodiscard]] const dependent_set &dependents() const { return _dependents; }

        [[nodiscard]] bool depends_on(const Node &other) const;

        [[nodiscard]] bool has_dependent(const Node &other) const;

        [[nodiscard]] AnimationDriver *animation() const { return _animation.get(); }

        [[nodiscard]] bool is_destroyed() const { return _destroyed; }

        [[nodiscard]] const std::string &label() const { return _label; }

        // nullptr once the node was destroyed or the graph has gone away.
        [[nodiscard]] graph_ptr graph() const { return _graph; }

        [[nodiscard]] size_t connection_count() const { return _connections.size(); }

        [[nodiscard]] size_t binding_count() const { return _bindings.size(); }

        [[nodiscard]] std::string str() const;

        friend class ReactiveGraph;
        friend class Connection;

    private:
        graph_ptr _graph;
        value::Value _value;
        std::string _label;
        Computation::ptr _computation;
        dependency_map _dependencies;
        dependent_set _dependents;
        CallbackList<ConnectionCallback> _connections;
        CallbackList<BindingHook> _bindings;
        std::shared_ptr<AnimationDriver> _animation;
        bool _destroyed{false};
    };

} // namespace kinetic

template<>
struct fmt::formatter<kinetic::Node> : fmt::formatter<std::string> {
    auto format(const kinetic::Node &n, format_context &ctx) const {
        return fmt::formatter<std::string>::format(n.str(), ctx);
    }
};

#endif // KINETIC_NODE_H
