#ifndef KINETIC_EVALUATION_CONTEXT_H
#define KINETIC_EVALUATION_CONTEXT_H

#include <kinetic/kinetic_base.h>

#include <cstdint>
#include <vector>

namespace kinetic {

    /**
     * Tracks, per cooperative unit, the stack of nodes currently being derived.
     *
     * A cooperative unit is any independently scheduled piece of work (a flush, a connection callback, a cascade
     * resumed later). Each unit has its own stack, so a read performed by one unit never registers against a
     * computation that belongs to another unit, even when the two interleave.
     */
    class KINETIC_EXPORT EvaluationContext {
    public:
        using unit_id = std::uint64_t;

        static constexpr unit_id ROOT_UNIT = 0;

        /**
         * Opens a fresh unit for the lifetime of the scope and makes it active, restoring the previously active
         * unit afterwards.
         */
        class KINETIC_EXPORT UnitScope {
        public:
            explicit UnitScope(EvaluationContext &context);

            UnitScope(const UnitScope &) = delete;

            UnitScope &operator=(const UnitScope &) = delete;

            ~UnitScope();

            [[nodiscard]] unit_id id() const { return _unit; }

        private:
            EvaluationContext &_context;
            unit_id _unit;
            unit_id _previous;
        };

        /**
         * Re-enters an existing unit (for example a suspended cascade being resumed).
         */
        class KINETIC_EXPORT ResumeScope {
        public:
            ResumeScope(EvaluationContext &context, unit_id unit);

            ResumeScope(const ResumeScope &) = delete;

            ResumeScope &operator=(const ResumeScope &) = delete;

            ~ResumeScope();

        private:
            EvaluationContext &_context;
            unit_id _previous;
        };

        /**
         * Pushes / pops the node being derived for the active unit for the lifetime of the scope.
         */
        class KINETIC_EXPORT DerivationScope {
        public:
            DerivationScope(EvaluationContext &context, Node &node);

            DerivationScope(const DerivationScope &) = delete;

            DerivationScope &operator=(const DerivationScope &) = delete;

            ~DerivationScope();

        private:
            EvaluationContext &_context;
            unit_id _unit;
        };

        [[nodiscard]] unit_id active_unit() const { return _active; }

        // The node currently being derived on the active unit, nullptr when no computation is running.
        [[nodiscard]] node_ptr current() const;

        [[nodiscard]] node_ptr current(unit_id unit) const;

        [[nodiscard]] size_t depth(unit_id unit) const;

        [[nodiscard]] bool is_deriving(const Node &node) const;

        void push(Node &node);

        void pop();

        unit_id open_unit();

        void close_unit(unit_id unit);

        // Drops every reference to a destroyed node from all stacks.
        void forget(const Node &node);

    private:
        void push(unit_id unit, Node &node);

        void pop(unit_id unit);

        unit_id _active{ROOT_UNIT};
        unit_id _next_unit{ROOT_UNIT + 1};
        dense_map<unit_id, std::vector<node_ptr> > _stacks;
    };

} // namespace kinetic

#endif // KINETIC_EVALUATION_CONTEXT_H
