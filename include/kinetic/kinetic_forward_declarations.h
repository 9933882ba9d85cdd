#ifndef KINETIC_FORWARD_DECLARATIONS_H
#define KINETIC_FORWARD_DECLARATIONS_H

#include <memory>

namespace kinetic {
    // Node - owned through shared_ptr, dependents index raw pointers only
    struct Node;
    using node_ptr = Node *;
    using node_s_ptr = std::shared_ptr<Node>;

    struct Computation;
    using computation_s_ptr = std::shared_ptr<const Computation>;

    class ComputeScope;

    class ReactiveGraph;
    using graph_ptr = ReactiveGraph *;

    class UpdateScheduler;

    class EvaluationContext;

    struct GraphObserver;

    struct AnimationDriver;
    class SpringDriver;
    class TweenDriver;

    class ChannelCodec;

    namespace value {
        struct TypeMeta;
        class Value;
    } // namespace value
} // namespace kinetic

#endif // KINETIC_FORWARD_DECLARATIONS_H
