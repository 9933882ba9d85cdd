#ifndef KINETIC_UPDATE_SCHEDULER_H
#define KINETIC_UPDATE_SCHEDULER_H

#include <kinetic/kinetic_base.h>

#include <cstddef>
#include <cstdint>

namespace kinetic {

    enum class UpdateMode : uint8_t { DEFERRED = 0, IMMEDIATE = 1 };

    /**
     * Describes a pending update. When the same node is enqueued more than once before it is applied the flags
     * are merged, a flag survives only if every request carried it.
     */
    struct UpdateFlags {
        // The value was already produced by (or deliberately bypasses) an animation driver.
        bool skip_animation{false};
        // The update is an animation step, the node's computation (if any) must not be re-run.
        bool animation_step{false};
        // Requested by a dependency that settled during propagation rather than by a write.
        bool from_dependency{false};

        [[nodiscard]] UpdateFlags merged(UpdateFlags other) const {
            return UpdateFlags{skip_animation && other.skip_animation, animation_step && other.animation_step,
                               from_dependency && other.from_dependency};
        }

        bool operator==(const UpdateFlags &) const = default;
    };

    /**
     * The pending-update table and the flush that applies it.
     *
     * Every write that needs to propagate lands here. A flush applies a pending node only once no other pending
     * node can still reach it through the dependency graph, so several writes within a tick coalesce into a single
     * downstream recomputation however deep the chains feeding a node are.
     *
     * A node re-requested by one of its dependencies may be applied again within the same flush. A node written
     * after it was applied (a connection writing back into a root), or one applied out of order to break a
     * dependency cycle, is settled for the rest of the flush and waits for the next one.
     */
    class KINETIC_EXPORT UpdateScheduler {
    public:
        explicit UpdateScheduler(ReactiveGraph &graph, UpdateMode mode = UpdateMode::DEFERRED);

        UpdateScheduler(const UpdateScheduler &) = delete;

        UpdateScheduler &operator=(const UpdateScheduler &) = delete;

        void enqueue(Node &node, UpdateFlags flags = {});

        // Removes the node from the pending table unconditionally.
        void cancel(const Node &node);

        /**
         * Applies every unblocked pending update. Returns the number of nodes applied. Re-entrant calls made while
         * a flush is running return 0 immediately, the running flush picks up anything they would have applied.
         */
        size_t flush();

        [[nodiscard]] bool is_pending(const Node &node) const;

        [[nodiscard]] const UpdateFlags *pending_flags(const Node &node) const;

        [[nodiscard]] size_t pending_count() const { return _pending.size(); }

        [[nodiscard]] bool is_flushing() const { return _flushing; }

        [[nodiscard]] UpdateMode mode() const { return _mode; }

        void set_mode(UpdateMode mode);

    private:
        // Pending nodes reachable from another pending node that has not settled yet.
        [[nodiscard]] dense_set<node_ptr> downstream_of_pending(const dense_set<node_ptr> &settled) const;

        [[nodiscard]] bool has_pending_dependency(const Node &node, const dense_set<node_ptr> &settled) const;

        ReactiveGraph &_graph;
        UpdateMode _mode;
        dense_map<node_ptr, UpdateFlags> _pending;
        bool _flushing{false};
    };

} // namespace kinetic

#endif // KINETIC_UPDATE_SCHEDULER_H
