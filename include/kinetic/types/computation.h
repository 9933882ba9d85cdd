#ifndef KINETIC_COMPUTATION_H
#define KINETIC_COMPUTATION_H

#include <kinetic/kinetic_base.h>
#include <kinetic/types/value/value.h>

#include <functional>
#include <string>

namespace kinetic {

    /**
     * A pure function deriving a node's value. The identity of a Computation is the object itself: the graph
     * memoises one live node per Computation instance, so two structurally identical computations created
     * separately are distinct entries.
     */
    struct KINETIC_EXPORT Computation {
        using ptr = computation_s_ptr;
        using body_type = std::function<value::Value(ComputeScope &)>;
        // Receives every value replaced by a newer evaluation and the final value when the node is destroyed.
        using discard_type = std::function<void(const value::Value &)>;

        explicit Computation(body_type body, std::string label = {}, discard_type on_discard = {});

        [[nodiscard]] value::Value evaluate(ComputeScope &scope) const;

        void discard(const value::Value &old_value) const;

        [[nodiscard]] const std::string &label() const { return _label; }

    private:
        body_type _body;
        std::string _label;
        discard_type _on_discard;
    };

    /**
     * The explicit evaluation context handed to a computation body. Reads through the scope register dependency
     * edges for the node being derived; peeks never do.
     */
    class KINETIC_EXPORT ComputeScope {
    public:
        ComputeScope(ReactiveGraph &graph, Node &node);

        const value::Value &use(Node &dependency);

        template<typename Handle>
            requires requires(const Handle &h) { typename Handle::value_type; h.node(); }
        const typename Handle::value_type &use(const Handle &handle) {
            return use(*handle.node()).template as<typename Handle::value_type>();
        }

        [[nodiscard]] const value::Value &peek(const Node &node) const;

        [[nodiscard]] ReactiveGraph &graph() const { return _graph; }

        [[nodiscard]] Node &node() const { return _node; }

    private:
        ReactiveGraph &_graph;
        Node &_node;
    };

    /**
     * Wraps a typed body `T(ComputeScope&)` into a new Computation.
     */
    template<typename T, typename F>
    computation_s_ptr make_computation(F &&fn, std::string label = {}) {
        return std::make_shared<const Computation>(
            [fn = std::forward<F>(fn)](ComputeScope &scope) -> value::Value {
                return value::Value{static_cast<T>(fn(scope))};
            },
            std::move(label));
    }

} // namespace kinetic

#endif // KINETIC_COMPUTATION_H
