#ifndef KINETIC_STATE_H
#define KINETIC_STATE_H

#include <kinetic/runtime/reactive_graph.h>
#include <kinetic/util/errors.h>

#include <functional>
#include <string>
#include <tuple>

namespace kinetic {

    namespace detail {
        inline ReactiveGraph &owning_graph(const node_s_ptr &node) {
            if (node == nullptr) { throw_error<std::logic_error>("Handle is not bound to a node"); }
            auto *graph = node->graph();
            if (graph == nullptr) { throw_error<std::logic_error>("{} is no longer attached to a graph", node->str()); }
            return *graph;
        }
    } // namespace detail

    /**
     * Typed, read-only view over a node. Handles share ownership of the node, the node is destroyed when the last
     * handle (and the last dependent node) lets go of it, or explicitly through destroy().
     */
    template<typename T>
    class Computed {
    public:
        using value_type = T;

        Computed() = default;

        explicit Computed(node_s_ptr node) : _node{std::move(node)} {
        }

        [[nodiscard]] const node_s_ptr &node() const { return _node; }

        // Reads the value, registering a dependency when called from inside a computation.
        [[nodiscard]] const T &get() const { return detail::owning_graph(_node).read(*_node).template as<T>(); }

        // Reads the value without ever registering a dependency.
        [[nodiscard]] const T &peek() const { return _node->value().template as<T>(); }

        [[nodiscard]] bool has_value() const { return _node != nullptr && _node->value().template is<T>(); }

        Connection on_change(std::function<void(const T &)> callback) const {
            std::weak_ptr<Node> weak{_node};
            return detail::owning_graph(_node).connect(*_node, [weak, callback = std::move(callback)] {
                if (auto node = weak.lock()) { callback(node->value().template as<T>()); }
            });
        }

        Connection bind(std::function<void(const T &)> hook) const {
            if (!hook) { return detail::owning_graph(_node).bind(*_node, BindingHook{}); }
            return detail::owning_graph(_node).bind(
                *_node, [hook = std::move(hook)](const value::Value &v) { hook(v.template as<T>()); });
        }

        void destroy() const {
            if (_node != nullptr && _node->graph() != nullptr) { _node->graph()->destroy(*_node); }
        }

        explicit operator bool() const { return _node != nullptr; }

    protected:
        node_s_ptr _node;
    };

    /**
     * Typed writable handle over a plain (non computed) node.
     */
    template<typename T>
    class State : public Computed<T> {
    public:
        State() = default;

        explicit State(node_s_ptr node) : Computed<T>{std::move(node)} {
        }

        void set(T value, WriteOptions options = {}) const {
            detail::owning_graph(this->_node).write(*this->_node, value::Value{std::move(value)}, options);
        }

        TweenDriver &tween(TweenProfile profile) const {
            return detail::owning_graph(this->_node).attach_tween(*this->_node, profile);
        }

        SpringDriver &spring(SpringOptions options = {}) const {
            return detail::owning_graph(this->_node).attach_spring(*this->_node, std::move(options));
        }
    };

    template<typename T>
    [[nodiscard]] State<T> make_state(ReactiveGraph &graph, T initial, std::string label = {}) {
        return State<T>{graph.create_node(value::Value{std::move(initial)}, std::move(label))};
    }

    /**
     * Returns the memoised node for an existing computation handle.
     */
    template<typename T>
    [[nodiscard]] Computed<T> make_computed(ReactiveGraph &graph, const computation_s_ptr &computation) {
        return Computed<T>{graph.compute(computation)};
    }

    /**
     * Creates a fresh computation from `fn` (a callable taking ComputeScope&) and its node.
     */
    template<typename T, typename F>
    [[nodiscard]] Computed<T> derive(ReactiveGraph &graph, F &&fn, std::string label = {}) {
        return Computed<T>{graph.compute(make_computation<T>(std::forward<F>(fn), std::move(label)))};
    }

    // Samples several handles at once without registering any dependency.
    template<typename... Handles>
    [[nodiscard]] auto peek_values(const Handles &... handles) {
        return std::tuple<typename Handles::value_type...>{handles.peek()...};
    }

} // namespace kinetic

#endif // KINETIC_STATE_H
