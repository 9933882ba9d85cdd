#include <kinetic/runtime/evaluation_context.h>
#include <kinetic/types/node.h>

#include <algorithm>

namespace kinetic {
    EvaluationContext::UnitScope::UnitScope(EvaluationContext &context)
        : _context{context}, _unit{context.open_unit()}, _previous{context._active} {
        _context._active = _unit;
    }

    EvaluationContext::UnitScope::~UnitScope() {
        _context._active = _previous;
        _context.close_unit(_unit);
    }

    EvaluationContext::ResumeScope::ResumeScope(EvaluationContext &context, unit_id unit)
        : _context{context}, _previous{context._active} {
        _context._active = unit;
    }

    EvaluationContext::ResumeScope::~ResumeScope() { _context._active = _previous; }

    // The unit is captured on entry so the matching pop lands on the same stack even if the active unit was
    // switched while the computation ran.
    EvaluationContext::DerivationScope::DerivationScope(EvaluationContext &context, Node &node)
        : _context{context}, _unit{context._active} {
        _context.push(_unit, node);
    }

    EvaluationContext::DerivationScope::~DerivationScope() { _context.pop(_unit); }

    node_ptr EvaluationContext::current() const { return current(_active); }

    node_ptr EvaluationContext::current(unit_id unit) const {
        auto it = _stacks.find(unit);
        if (it == _stacks.end() || it->second.empty()) { return nullptr; }
        return it->second.back();
    }

    size_t EvaluationContext::depth(unit_id unit) const {
        auto it = _stacks.find(unit);
        return it == _stacks.end() ? 0 : it->second.size();
    }

    bool EvaluationContext::is_deriving(const Node &node) const {
        return std::ranges::any_of(_stacks, [&node](const auto &entry) {
            return std::ranges::find(entry.second, &node) != entry.second.end();
        });
    }

    void EvaluationContext::push(Node &node) { push(_active, node); }

    void EvaluationContext::pop() { pop(_active); }

    void EvaluationContext::push(unit_id unit, Node &node) { _stacks[unit].push_back(&node); }

    void EvaluationContext::pop(unit_id unit) {
        auto it = _stacks.find(unit);
        if (it == _stacks.end() || it->second.empty()) { return; }
        it->second.pop_back();
        if (it->second.empty()) { _stacks.erase(it); }
    }

    EvaluationContext::unit_id EvaluationContext::open_unit() { return _next_unit++; }

    void EvaluationContext::close_unit(unit_id unit) { _stacks.erase(unit); }

    void EvaluationContext::forget(const Node &node) {
        for (auto &[unit, stack]: _stacks) {
            std::ranges::replace(stack, const_cast<node_ptr>(&node), static_cast<node_ptr>(nullptr));
        }
    }
} // namespace kinetic
