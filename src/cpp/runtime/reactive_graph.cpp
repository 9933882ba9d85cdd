#include <kinetic/runtime/reactive_graph.h>
#include <kinetic/util/errors.h>

#include <fmt/format.h>

#include <algorithm>
#include <utility>
#include <cstdio>

namespace kinetic {
    ReactiveGraph::ReactiveGraph(GraphConfig config)
        : _config{config}, _scheduler{*this, config.mode}, _interpolator{make_channel_interpolator(_codec)} {
        if (!(_config.rest_epsilon > 0.0)) {
            throw_error<std::invalid_argument>("rest_epsilon must be positive, got {}", _config.rest_epsilon);
        }
    }

    ReactiveGraph::~ReactiveGraph() {
        // Nodes outlive the graph only through user handles, detach them so they never call back into us.
        for (auto *node: _nodes) { node->_graph = nullptr; }
        _nodes.clear();
        _animated.clear();
        _memo.clear();
    }

    node_s_ptr ReactiveGraph::create_node(value::Value initial, std::string label) {
        auto node = std::make_shared<Node>(Node::Key{}, this, std::move(initial), std::move(label));
        _nodes.insert(node.get());
        return node;
    }

    node_s_ptr ReactiveGraph::compute(const computation_s_ptr &computation) {
        if (!computation) { throw_error<std::invalid_argument>("compute requires a computation"); }

        if (auto it = _memo.find(computation.get()); it != _memo.end()) {
            if (auto live = it->second.lock(); live && !live->_destroyed) { return live; }
            _memo.erase(it);
        }

        auto node = std::make_shared<Node>(Node::Key{}, this, value::Value{}, computation->label());
        node->_computation = computation;
        _nodes.insert(node.get());
        _memo[computation.get()] = node;
        // Eager evaluation establishes the initial value and dependency edges, a failure leaves the value empty.
        recompute(*node);
        return node;
    }

    const value::Value &ReactiveGraph::read(Node &node) {
        if (auto *active = _context.current(); active != nullptr) { link(*active, node); }
        return node._value;
    }

    const value::Value &ReactiveGraph::peek(const Node &node) const { return node._value; }

    void ReactiveGraph::write(Node &node, value::Value value, WriteOptions options) {
        check_writable(node, "write");
        if (!options.skip_animation && node._animation) {
            auto driver = node._animation;
            driver->on_write(*this, node, std::move(value));
            return;
        }
        assign(node, std::move(value), options.force, UpdateFlags{options.skip_animation, false});
    }

    void ReactiveGraph::assign(Node &node, value::Value value, bool force, UpdateFlags flags) {
        // Composite and reference values always propagate, cheap equality can not be assumed for them.
        const bool changed = force || !value.is_scalar() || !value.equals(node._value);
        node._value = std::move(value);
        if (changed) { _scheduler.enqueue(node, flags); }
    }

    void ReactiveGraph::publish_animated(Node &node, value::Value value) {
        if (node._destroyed) { return; }
        assign(node, std::move(value), false, UpdateFlags{true, true});
    }

    RecomputeResult ReactiveGraph::recompute(Node &node) {
        if (!node._computation || node._destroyed) { return RecomputeResult::UNCHANGED; }

        auto self = node.shared_from_this();
        auto computation = node._computation;
        notify_observers([&node](GraphObserver &o) { o.on_before_recompute(node); });

        // The dependency set is rebuilt from scratch on every run. The previous dependencies are held here so
        // they stay alive (and can be restored) until the new evaluation has finished.
        Node::dependency_map previous;
        unlink_dependencies(node, previous);

        value::Value result;
        std::string failure;
        {
            EvaluationContext::DerivationScope derivation{_context, node};
            try {
                ComputeScope scope{*this, node};
                result = computation->evaluate(scope);
            } catch (const std::exception &e) {
                failure = e.what();
                if (failure.empty()) { failure = "computation failed"; }
            } catch (...) {
                failure = describe_exception(std::current_exception());
            }
        }

        if (node._destroyed) { return RecomputeResult::UNCHANGED; }

        if (!failure.empty()) {
            // Keep the graph as it was before the failed run: prior value and prior dependency edges.
            Node::dependency_map partial;
            unlink_dependencies(node, partial);
            for (auto &[dependency, _]: previous) { link(node, *dependency); }
            report_computation_error(node, failure);
            notify_observers([&node](GraphObserver &o) { o.on_after_recompute(node, false); });
            return RecomputeResult::FAILED;
        }

        const bool changed = !result.is_scalar() || !result.equals(node._value);
        if (changed) {
            auto old_value = std::exchange(node._value, std::move(result));
            try {
                computation->discard(old_value);
            } catch (const std::exception &e) {
                report_computation_error(node, fmt::format("discarding previous value: {}", e.what()));
            }
        } else {
            try {
                computation->discard(result);
            } catch (const std::exception &e) {
                report_computation_error(node, fmt::format("discarding unchanged value: {}", e.what()));
            }
        }
        notify_observers([&node, changed](GraphObserver &o) { o.on_after_recompute(node, changed); });
        return changed ? RecomputeResult::CHANGED : RecomputeResult::UNCHANGED;
    }

    void ReactiveGraph::propagate(Node &node) {
        if (node._destroyed) { return; }
        auto self = node.shared_from_this();
        std::vector<node_ptr> dependents(node._dependents.begin(), node._dependents.end());
        for (auto *dependent: dependents) {
            // An earlier enqueue (immediate mode) may already have severed this edge
            if (node._dependents.contains(dependent)) {
                _scheduler.enqueue(*dependent, UpdateFlags{.from_dependency = true});
            }
        }
        fire_bindings(node);
        fire_connections(node);
    }

    void ReactiveGraph::apply_update(Node &node, UpdateFlags flags) {
        if (node._destroyed) { return; }
        auto self = node.shared_from_this();
        if (node._computation && !flags.animation_step) {
            if (recompute(node) != RecomputeResult::CHANGED) { return; }
        }
        propagate(node);
    }

    void ReactiveGraph::destroy(Node &node) {
        if (node._destroyed || node._graph != this) { return; }
        auto self = node.shared_from_this();
        notify_observers([&node](GraphObserver &o) { o.on_node_destroyed(node); });
        if (node._computation) {
            try {
                node._computation->discard(node._value);
            } catch (const std::exception &e) {
                report_computation_error(node, fmt::format("discarding final value: {}", e.what()));
            }
        }
        release(node);
        node._graph = nullptr;
    }

    void ReactiveGraph::release(Node &node) noexcept {
        node._destroyed = true;
        _scheduler.cancel(node);
        _animated.erase(&node);
        _context.forget(node);
        _nodes.erase(&node);

        if (node._computation) {
            if (auto it = _memo.find(node._computation.get()); it != _memo.end()) {
                auto live = it->second.lock();
                if (!live || live.get() == &node) { _memo.erase(it); }
            }
        }

        Node::dependency_map dependencies;
        unlink_dependencies(node, dependencies);

        auto dependents = std::move(node._dependents);
        node._dependents.clear();
        for (auto *dependent: dependents) { dependent->_dependencies.erase(&node); }

        node._connections.clear();
        node._bindings.clear();
        auto animation = std::move(node._animation);
        node._computation.reset();
        // dependencies and animation are released here, which may in turn release nodes only they kept alive.
    }

    void ReactiveGraph::link(Node &dependent, Node &dependency) {
        if (&dependent == &dependency || dependent._destroyed || dependency._destroyed) { return; }
        dependent._dependencies.try_emplace(&dependency, dependency.shared_from_this());
        dependency._dependents.insert(&dependent);
    }

    void ReactiveGraph::unlink_dependencies(Node &node, Node::dependency_map &released) {
        released = std::move(node._dependencies);
        node._dependencies.clear();
        for (auto &[dependency, _]: released) { dependency->_dependents.erase(&node); }
    }

    Connection ReactiveGraph::connect(Node &node, ConnectionCallback callback) {
        check_writable(node, "connect");
        if (!callback) { throw_error<std::invalid_argument>("Cannot connect an empty callback to {}", node.str()); }
        auto id = node._connections.add(std::move(callback));
        return Connection{node.weak_from_this(), id, Connection::Kind::Callback};
    }

    Connection ReactiveGraph::bind(Node &node, BindingHook hook) {
        if (node._destroyed) { throw_error<std::logic_error>("Cannot bind destroyed node {}", node.str()); }
        if (!hook) { throw_error<std::invalid_argument>("Cannot bind {} to an unbindable (empty) target", node.str()); }
        auto id = node._bindings.add(std::move(hook));
        return Connection{node.weak_from_this(), id, Connection::Kind::Binding};
    }

    void ReactiveGraph::fire_bindings(Node &node) {
        if (node._bindings.empty()) { return; }
        // Binding failures belong to the external collaborator and are not contained here.
        const value::Value settled{node._value};
        node._bindings.notify([&settled](const BindingHook &hook) { hook(settled); });
    }

    void ReactiveGraph::fire_connections(Node &node) {
        node._connections.notify([this, &node](const ConnectionCallback &callback) {
            // Each callback runs as its own unit, reads inside it never attach to an outer computation.
            EvaluationContext::UnitScope unit{_context};
            try {
                callback();
            } catch (const std::exception &e) {
                report_connection_error(node, e.what());
            }
        });
    }

    void ReactiveGraph::check_writable(const Node &node, std::string_view operation) const {
        if (node._destroyed || node._graph != this) {
            throw_error<std::logic_error>("Cannot {} destroyed or foreign node {}", operation, node.str());
        }
        if (node._computation && operation == "write") {
            throw_error<std::logic_error>("Cannot write computed node {}, its value is derived", node.str());
        }
    }

    TweenDriver &ReactiveGraph::attach_tween(Node &node, TweenProfile profile) {
        check_writable(node, "animate");
        if (node._computation) { throw_error<std::logic_error>("Cannot animate computed node {}", node.str()); }
        if (profile.duration.count() < 0.0 || profile.delay.count() < 0.0) {
            throw_error<std::invalid_argument>("Tween duration and delay must not be negative ({}s, {}s)",
                                               profile.duration.count(), profile.delay.count());
        }
        auto driver = std::make_shared<TweenDriver>(profile);
        node._animation = driver;
        _animated.insert(&node);
        return *driver;
    }

    SpringDriver &ReactiveGraph::attach_spring(Node &node, SpringOptions options) {
        check_writable(node, "animate");
        if (node._computation) { throw_error<std::logic_error>("Cannot animate computed node {}", node.str()); }
        const auto &goal = options.goal.is_set() ? options.goal.sample() : node._value;
        if (!_codec.supports(goal.meta())) {
            throw_error<std::invalid_argument>("Cannot attach a spring to {}, values of type '{}' have no channels",
                                               node.str(), goal.type_name());
        }
        auto driver = std::make_shared<SpringDriver>(std::move(options), _config.rest_epsilon);
        node._animation = driver;
        _animated.insert(&node);
        driver->initialise(*this, node);
        return *driver;
    }

    void ReactiveGraph::detach_animation(Node &node) {
        node._animation.reset();
        _animated.erase(&node);
    }

    SpringDriver *ReactiveGraph::spring(const Node &node) const {
        return dynamic_cast<SpringDriver *>(node._animation.get());
    }

    TweenDriver *ReactiveGraph::tween(const Node &node) const {
        return dynamic_cast<TweenDriver *>(node._animation.get());
    }

    void ReactiveGraph::tick(tick_delta_t dt) {
        _clock.advance(dt);
        std::vector<node_ptr> animated(_animated.begin(), _animated.end());
        for (auto *node: animated) {
            // Skip nodes destroyed or detached by an earlier step in this tick
            if (!_animated.contains(node)) { continue; }
            auto self = node->shared_from_this();
            auto driver = node->_animation;
            if (!driver) { continue; }
            // A failing driver only stalls its own node, the rest of the tick and the flush still run
            try {
                driver->step(*this, *node, _clock.now());
            } catch (const std::exception &e) {
                report_animation_error(*node, e.what());
            }
        }
        _scheduler.flush();
    }

    void ReactiveGraph::set_interpolator(Interpolator interpolator) {
        if (!interpolator) { throw_error<std::invalid_argument>("Interpolator must not be empty"); }
        _interpolator = std::move(interpolator);
    }

    void ReactiveGraph::add_observer(GraphObserver::ptr observer) {
        if (observer == nullptr) { throw_error<std::invalid_argument>("Observer must not be null"); }
        if (std::ranges::find(_observers, observer) == _observers.end()) { _observers.push_back(observer); }
    }

    void ReactiveGraph::remove_observer(GraphObserver::ptr observer) { std::erase(_observers, observer); }

    void ReactiveGraph::report_computation_error(const Node &node, std::string_view message) {
        notify_observers([&](GraphObserver &o) { o.on_computation_error(node, message); });
        if (_config.log_errors) {
            fmt::print(stderr, "[kinetic] computation of {} failed: {}\n", node.str(), message);
        }
    }

    void ReactiveGraph::report_connection_error(const Node &node, std::string_view message) {
        notify_observers([&](GraphObserver &o) { o.on_connection_error(node, message); });
        if (_config.log_errors) {
            fmt::print(stderr, "[kinetic] connection callback of {} failed: {}\n", node.str(), message);
        }
    }

    void ReactiveGraph::report_dependency_cycle(const Node &node) {
        notify_observers([&](GraphObserver &o) { o.on_dependency_cycle(node); });
        if (_config.log_errors) {
            fmt::print(stderr, "[kinetic] dependency cycle through {}, applying it out of order\n", node.str());
        }
    }

    void ReactiveGraph::report_spring_fault(const Node &node, size_t channel) {
        notify_observers([&](GraphObserver &o) { o.on_spring_fault(node, channel); });
        if (_config.log_errors) {
            fmt::print(stderr, "[kinetic] spring on {} produced a non-finite state on channel {}, reset\n",
                       node.str(), channel);
        }
    }

    void ReactiveGraph::report_animation_error(const Node &node, std::string_view message) {
        notify_observers([&](GraphObserver &o) { o.on_animation_error(node, message); });
        if (_config.log_errors) {
            fmt::print(stderr, "[kinetic] animation of {} failed: {}\n", node.str(), message);
        }
    }
} // namespace kinetic
