#ifndef KINETIC_ANIMATION_DRIVER_H
#define KINETIC_ANIMATION_DRIVER_H

#include <kinetic/kinetic_base.h>
#include <kinetic/types/value/value.h>

namespace kinetic {

    /**
     * Value driver attached to a node. A node carries at most one driver; writes to the node are redirected to
     * the driver (unless the write skips animation) and the graph steps every driver once per tick.
     */
    struct AnimationDriver {
        virtual ~AnimationDriver() = default;

        // A redirected write: the new value becomes the driver's goal.
        virtual void on_write(ReactiveGraph &graph, Node &node, value::Value goal) = 0;

        virtual void step(ReactiveGraph &graph, Node &node, tick_time_t now) = 0;

        [[nodiscard]] virtual bool is_animating() const = 0;

        [[nodiscard]] virtual const char *kind() const = 0;
    };

} // namespace kinetic

#endif // KINETIC_ANIMATION_DRIVER_H
