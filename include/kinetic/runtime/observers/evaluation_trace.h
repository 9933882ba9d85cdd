#ifndef KINETIC_EVALUATION_TRACE_H
#define KINETIC_EVALUATION_TRACE_H

#include <kinetic/runtime/graph_observer.h>

#include <optional>
#include <string>

namespace kinetic {

    /**
     * @brief Logs out the propagation steps as the graph flushes and recomputes.
     *
     * This is voluminous but can be helpful tracing down unexpected behaviour, for example a computation that
     * recomputes more often than expected or a dependency cycle.
     */
    class KINETIC_EXPORT EvaluationTrace : public GraphObserver {
    public:
        /**
         * @brief Construct a new Evaluation Trace object
         *
         * @param filter Used to restrict which node events to report (substring match on the label)
         * @param flush Log flush related events
         * @param recompute Log recompute related events
         * @param errors Log contained failures (computation, connection, cycle, spring)
         */
        explicit EvaluationTrace(const std::optional<std::string> &filter = std::nullopt, bool flush = true,
                                 bool recompute = true, bool errors = true);

        void on_before_flush(const ReactiveGraph &graph, size_t pending) override;
        void on_after_flush(const ReactiveGraph &graph, size_t applied) override;
        void on_before_recompute(const Node &node) override;
        void on_after_recompute(const Node &node, bool changed) override;
        void on_computation_error(const Node &node, std::string_view message) override;
        void on_connection_error(const Node &node, std::string_view message) override;
        void on_dependency_cycle(const Node &node) override;
        void on_spring_fault(const Node &node, size_t channel) override;
        void on_animation_error(const Node &node, std::string_view message) override;
        void on_node_destroyed(const Node &node) override;

        // Static configuration
        static void set_print_all_values(bool value);
        static void set_use_stderr(bool value);

    private:
        std::optional<std::string> _filter;
        bool _flush;
        bool _recompute;
        bool _errors;

        static bool _print_all_values;
        static bool _use_stderr;

        void _print(const std::string &msg) const;
        void _print_node(const Node &node, const std::string &msg, bool add_value = false) const;
        bool _should_log_node(const Node &node) const;
    };

} // namespace kinetic

#endif // KINETIC_EVALUATION_TRACE_H
