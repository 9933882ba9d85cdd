#ifndef KINETIC_GRAPH_OBSERVER_H
#define KINETIC_GRAPH_OBSERVER_H

#include <kinetic/kinetic_base.h>

#include <cstddef>
#include <string_view>

namespace kinetic {

    // GraphObserver - externally owned observer of the propagation life-cycle, the graph keeps raw pointers only.
    struct GraphObserver {
        using ptr = GraphObserver *;

        virtual ~GraphObserver() = default;

        virtual void on_before_flush(const ReactiveGraph &, size_t /*pending*/) {
        }

        virtual void on_after_flush(const ReactiveGraph &, size_t /*applied*/) {
        }

        virtual void on_before_recompute(const Node &) {
        }

        virtual void on_after_recompute(const Node &, bool /*changed*/) {
        }

        virtual void on_computation_error(const Node &, std::string_view /*message*/) {
        }

        virtual void on_connection_error(const Node &, std::string_view /*message*/) {
        }

        virtual void on_dependency_cycle(const Node &) {
        }

        virtual void on_spring_fault(const Node &, size_t /*channel*/) {
        }

        virtual void on_animation_error(const Node &, std::string_view /*message*/) {
        }

        virtual void on_node_destroyed(const Node &) {
        }
    };

} // namespace kinetic

#endif // KINETIC_GRAPH_OBSERVER_H
