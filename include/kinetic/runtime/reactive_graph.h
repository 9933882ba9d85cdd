#ifndef KINETIC_REACTIVE_GRAPH_H
#define KINETIC_REACTIVE_GRAPH_H

#include <kinetic/animation/channel_codec.h>
#include <kinetic/animation/spring.h>
#include <kinetic/animation/tween.h>
#include <kinetic/runtime/evaluation_context.h>
#include <kinetic/runtime/graph_observer.h>
#include <kinetic/runtime/update_scheduler.h>
#include <kinetic/types/node.h>

#include <string>
#include <string_view>
#include <vector>

namespace kinetic {

    struct GraphConfig {
        UpdateMode mode{UpdateMode::DEFERRED};
        // Per channel threshold on displacement and velocity below which a spring is at rest.
        double rest_epsilon{1e-4};
        // Write contained failures (computations, connections, spring faults, cycles) to stderr.
        bool log_errors{true};
    };

    struct WriteOptions {
        // Propagate even when the new value equals the old one.
        bool force{false};
        // Assign directly, bypassing an attached spring or tween.
        bool skip_animation{false};
    };

    enum class RecomputeResult : uint8_t { CHANGED, UNCHANGED, FAILED };

    /**
     * Owns the shared state of a reactive graph: the memoised computation cache, the pending-update scheduler,
     * the per-unit execution context, the animation clock and the set of animated nodes.
     *
     * Nodes are owned by their handles (and by the nodes that depend on them); the graph only indexes them. The
     * graph must be driven from a single thread, re-entrant calls from computations and callbacks are supported.
     * If the graph is destroyed before its nodes, the nodes are detached and become inert.
     */
    class KINETIC_EXPORT ReactiveGraph {
    public:
        explicit ReactiveGraph(GraphConfig config = {});

        ReactiveGraph(const ReactiveGraph &) = delete;

        ReactiveGraph &operator=(const ReactiveGraph &) = delete;

        ~ReactiveGraph();

        // ========== Nodes ==========

        [[nodiscard]] node_s_ptr create_node(value::Value initial, std::string label = {});

        /**
         * Returns the live node for this computation if there is one, otherwise creates it and evaluates it once
         * to establish the initial value and dependency edges.
         */
        [[nodiscard]] node_s_ptr compute(const computation_s_ptr &computation);

        /**
         * Returns the current value, registering a dependency edge if a computation is being derived on the
         * active cooperative unit.
         */
        const value::Value &read(Node &node);

        // Returns the current value without ever registering a dependency.
        [[nodiscard]] const value::Value &peek(const Node &node) const;

        void write(Node &node, value::Value value, WriteOptions options = {});

        /**
         * Re-runs the node's computation with a dependency set rebuilt from scratch. A failing computation keeps
         * its previous value, the failure is reported and nothing propagates.
         */
        RecomputeResult recompute(Node &node);

        // Schedules every dependent for recomputation, then fires bindings and connections.
        void propagate(Node &node);

        // Idempotent; safe to call from within computations and callbacks.
        void destroy(Node &node);

        // ========== Callbacks ==========

        Connection connect(Node &node, ConnectionCallback callback);

        // Attach an external binding hook, receives every settled value. An empty hook is rejected.
        Connection bind(Node &node, BindingHook hook);

        // ========== Animation ==========

        // Replaces any spring already on the node.
        TweenDriver &attach_tween(Node &node, TweenProfile profile);

        // Replaces any tween already on the node. The node's value type must be supported by the codec.
        SpringDriver &attach_spring(Node &node, SpringOptions options = {});

        void detach_animation(Node &node);

        [[nodiscard]] SpringDriver *spring(const Node &node) const;

        [[nodiscard]] TweenDriver *tween(const Node &node) const;

        // Publish a value produced by an animation driver through the normal propagation pipeline.
        void publish_animated(Node &node, value::Value value);

        // ========== Driving ==========

        /**
         * The periodic tick: advances the animation clock, steps every animation driver, then flushes the pending
         * updates (in deferred mode).
         */
        void tick(tick_delta_t dt);

        size_t flush() { return _scheduler.flush(); }

        [[nodiscard]] tick_time_t now() const { return _clock.now(); }

        [[nodiscard]] const TickClock &clock() const { return _clock; }

        [[nodiscard]] UpdateMode update_mode() const { return _scheduler.mode(); }

        void set_update_mode(UpdateMode mode) { _scheduler.set_mode(mode); }

        // ========== Collaborators and configuration ==========

        [[nodiscard]] const GraphConfig &config() const { return _config; }

        [[nodiscard]] ChannelCodec &codec() { return _codec; }

        [[nodiscard]] const ChannelCodec &codec() const { return _codec; }

        [[nodiscard]] const Interpolator &interpolator() const { return _interpolator; }

        void set_interpolator(Interpolator interpolator);

        [[nodiscard]] EvaluationContext &context() { return _context; }

        [[nodiscard]] const EvaluationContext &context() const { return _context; }

        [[nodiscard]] UpdateScheduler &scheduler() { return _scheduler; }

        [[nodiscard]] const UpdateScheduler &scheduler() const { return _scheduler; }

        void add_observer(GraphObserver::ptr observer);

        void remove_observer(GraphObserver::ptr observer);

        // ========== Introspection ==========

        [[nodiscard]] size_t node_count() const { return _nodes.size(); }

        [[nodiscard]] size_t memoised_count() const { return _memo.size(); }

        [[nodiscard]] size_t animated_count() const { return _animated.size(); }

        // ========== Reporting ==========

        void report_computation_error(const Node &node, std::string_view message);

        void report_connection_error(const Node &node, std::string_view message);

        void report_dependency_cycle(const Node &node);

        void report_spring_fault(const Node &node, size_t channel);

        void report_animation_error(const Node &node, std::string_view message);

        friend class UpdateScheduler;
        friend struct Node;

    private:
        // Applies a settled update: recompute unless this is an animation step, then propagate.
        void apply_update(Node &node, UpdateFlags flags);

        void assign(Node &node, value::Value value, bool force, UpdateFlags flags);

        void link(Node &dependent, Node &dependency);

        void unlink_dependencies(Node &node, Node::dependency_map &released);

        // Removes every trace of the node from the graph's tables, called on destroy and from ~Node.
        void release(Node &node) noexcept;

        void fire_bindings(Node &node);

        void fire_connections(Node &node);

        void check_writable(const Node &node, std::string_view operation) const;

        template<typename Fn>
        void notify_observers(Fn &&fn) {
            auto snapshot{_observers};
            for (auto *observer: snapshot) { fn(*observer); }
        }

        GraphConfig _config;
        TickClock _clock;
        EvaluationContext _context;
        UpdateScheduler _scheduler;
        ChannelCodec _codec;
        Interpolator _interpolator;
        dense_set<node_ptr> _nodes;
        dense_set<node_ptr> _animated;
        dense_map<const Computation *, std::weak_ptr<Node> > _memo;
        std::vector<GraphObserver::ptr> _observers;
    };

} // namespace kinetic

#endif // KINETIC_REACTIVE_GRAPH_H
