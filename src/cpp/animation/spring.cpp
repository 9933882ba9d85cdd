#include <kinetic/animation/spring.h>
#include <kinetic/runtime/reactive_graph.h>
#include <kinetic/util/errors.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace kinetic {
    SpringCoefficients spring_coefficients(double time, double damping, double speed) {
        if (time == 0.0 || speed == 0.0) { return SpringCoefficients{1.0, 0.0, 0.0, 1.0}; }

        if (damping > 1.0) {
            // Overdamped
            const double alpha = std::sqrt(damping * damping - 1.0);
            const double z1 = -speed * (damping + alpha);
            const double z2 = speed * (alpha - damping);
            const double e1 = std::exp(z1 * time);
            const double e2 = std::exp(z2 * time);
            const double k = -1.0 / (2.0 * alpha * speed);
            return SpringCoefficients{
                .pos_pos = (z1 * e2 - z2 * e1) * k,
                .pos_vel = (e1 - e2) * k,
                .vel_pos = speed * speed * (e2 - e1) * k,
                .vel_vel = (z1 * e1 - z2 * e2) * k,
            };
        }

        if (damping == 1.0) {
            // Critically damped
            const double e = std::exp(-speed * time);
            return SpringCoefficients{
                .pos_pos = e * (1.0 + speed * time),
                .pos_vel = e * time,
                .vel_pos = e * (-speed * speed * time),
                .vel_vel = e * (1.0 - speed * time),
            };
        }

        // Underdamped
        const double alpha = speed * std::sqrt(1.0 - damping * damping);
        const double beta = speed * damping;
        const double e = std::exp(-beta * time);
        const double s = std::sin(alpha * time);
        const double c = std::cos(alpha * time);
        return SpringCoefficients{
            .pos_pos = e * (c + beta * s / alpha),
            .pos_vel = e * s / alpha,
            .vel_pos = -speed * speed * e * s / alpha,
            .vel_vel = e * (c - beta * s / alpha),
        };
    }

    const value::Value &SpringSource::sample() const { return _node ? _node->value() : _constant; }

    namespace {
        double number_from(const ChannelCodec &codec, const SpringSource &source, const char *what) {
            const auto &v = source.sample();
            if (!v.has_value() || !codec.supports(v.meta())) {
                throw_error<std::invalid_argument>("Spring {} must be numeric, got '{}'", what, v.type_name());
            }
            auto channels = codec.unpack(v);
            if (channels.size() != 1) {
                throw_error<std::invalid_argument>("Spring {} must be a single number, got {} channels", what,
                                                   channels.size());
            }
            return channels[0];
        }

        bool at_rest(double displacement, double velocity, double epsilon) {
            return std::abs(displacement) < epsilon && std::abs(velocity) < epsilon;
        }
    } // namespace

    SpringDriver::SpringDriver(SpringOptions options, double rest_epsilon)
        : _options{std::move(options)}, _epsilon{rest_epsilon} {
    }

    void SpringDriver::initialise(ReactiveGraph &graph, Node &node) {
        _speed = number_from(graph.codec(), _options.speed, "speed");
        _damping = number_from(graph.codec(), _options.damping, "damping");
        if (_speed < 0.0 || _damping < 0.0) {
            throw_error<std::invalid_argument>("Spring speed and damping must not be negative ({}, {})", _speed,
                                               _damping);
        }
        snap(graph, node, _options.goal.is_set() ? _options.goal.sample() : node.value());
    }

    void SpringDriver::on_write(ReactiveGraph &graph, Node &node, value::Value goal) {
        // A direct write replaces whatever the goal was sourced from
        _options.goal = SpringSource{goal};
        retarget(graph, node, goal, graph.now());
    }

    void SpringDriver::step(ReactiveGraph &graph, Node &node, tick_time_t now) {
        sample(graph, node, now);
        if (!_origin) { return; }

        auto [position, velocity] = state_at(now);
        bool resting{true};
        for (size_t i = 0; i < position.size(); ++i) {
            if (!std::isfinite(position[i]) || !std::isfinite(velocity[i])) {
                // Reset the channel onto its target at rest, the trajectory for it restarts from there
                position[i] = _target[i];
                velocity[i] = 0.0;
                _start_position[i] = _target[i];
                _start_velocity[i] = 0.0;
                graph.report_spring_fault(node, i);
            }
            if (!at_rest(position[i] - _target[i], velocity[i], _epsilon)) { resting = false; }
        }

        if (resting) {
            come_to_rest(graph, node);
            return;
        }
        graph.publish_animated(node, graph.codec().pack(position, _type));
    }

    std::pair<channel_vector, channel_vector> SpringDriver::state_at(tick_time_t now) const {
        if (!_origin) { return {_start_position, _start_velocity}; }
        const auto c = spring_coefficients(std::max(0.0, (now - *_origin).count()), _damping, _speed);
        channel_vector position(_target.size());
        channel_vector velocity(_target.size());
        for (size_t i = 0; i < _target.size(); ++i) {
            const double d0 = _start_position[i] - _target[i];
            const double v0 = _start_velocity[i];
            position[i] = _target[i] + d0 * c.pos_pos + v0 * c.pos_vel;
            velocity[i] = d0 * c.vel_pos + v0 * c.vel_vel;
        }
        return {std::move(position), std::move(velocity)};
    }

    void SpringDriver::set_position(ReactiveGraph &graph, Node &node, const value::Value &position) {
        if (position.meta() != _type) {
            throw_error<std::invalid_argument>("Spring position must be a '{}', got '{}'", _goal.type_name(),
                                               position.type_name());
        }
        auto channels = graph.codec().unpack(position);
        if (channels.size() != _target.size()) {
            throw_error<std::invalid_argument>("Spring position has {} channels, expected {}", channels.size(),
                                               _target.size());
        }
        auto velocity = state_at(graph.now()).second;
        restart_from(std::move(channels), std::move(velocity), graph.now());
        graph.publish_animated(node, position);
    }

    void SpringDriver::set_velocity(ReactiveGraph &graph, Node &node, const value::Value &velocity) {
        auto channels = graph.codec().unpack(velocity);
        if (channels.size() != _target.size()) {
            throw_error<std::invalid_argument>("Spring velocity on {} has {} channels, expected {}", node.str(),
                                               channels.size(), _target.size());
        }
        auto position = state_at(graph.now()).first;
        restart_from(std::move(position), std::move(channels), graph.now());
    }

    void SpringDriver::add_velocity(ReactiveGraph &graph, Node &node, const value::Value &velocity) {
        auto channels = graph.codec().unpack(velocity);
        if (channels.size() != _target.size()) {
            throw_error<std::invalid_argument>("Spring velocity on {} has {} channels, expected {}", node.str(),
                                               channels.size(), _target.size());
        }
        auto [position, current] = state_at(graph.now());
        for (size_t i = 0; i < current.size(); ++i) { current[i] += channels[i]; }
        restart_from(std::move(position), std::move(current), graph.now());
    }

    void SpringDriver::sample(ReactiveGraph &graph, Node &node, tick_time_t now) {
        const double speed = std::max(0.0, sample_parameter(graph, node, _options.speed, "speed", _speed));
        const double damping = std::max(0.0, sample_parameter(graph, node, _options.damping, "damping", _damping));
        if (speed != _speed || damping != _damping) {
            // Capture the state under the old parameters so the change does not jump the trajectory
            if (_origin) {
                auto [position, velocity] = state_at(now);
                restart_from(std::move(position), std::move(velocity), now);
            }
            _speed = speed;
            _damping = damping;
        }

        if (_options.goal.is_node()) {
            const auto &goal = _options.goal.sample();
            if (!goal.equals(_goal)) { retarget(graph, node, goal, now); }
        }
    }

    double SpringDriver::sample_parameter(ReactiveGraph &graph, const Node &node, const SpringSource &source,
                                          const char *what, double last) const {
        try {
            return number_from(graph.codec(), source, what);
        } catch (const std::invalid_argument &e) {
            // Keep moving under the last valid value until the source holds a number again
            graph.report_animation_error(node, e.what());
            return last;
        }
    }

    void SpringDriver::retarget(ReactiveGraph &graph, Node &node, const value::Value &goal, tick_time_t now) {
        if (_type == nullptr || goal.meta() != _type) {
            snap(graph, node, goal);
            return;
        }
        if (goal.equals(_goal)) { return; }

        auto target = graph.codec().unpack(goal);
        if (target.size() != _target.size()) {
            snap(graph, node, goal);
            return;
        }
        auto [position, velocity] = state_at(now);
        _goal = goal;
        _target = std::move(target);
        restart_from(std::move(position), std::move(velocity), now);
    }

    void SpringDriver::snap(ReactiveGraph &graph, Node &node, const value::Value &goal) {
        _goal = goal;
        _origin.reset();
        if (graph.codec().supports(goal.meta())) {
            _type = goal.meta();
            _target = graph.codec().unpack(goal);
        } else {
            // Nothing to animate, the spring stays dormant until it is given a value it can decompose
            _type = nullptr;
            _target.clear();
        }
        _start_position = _target;
        _start_velocity.assign(_target.size(), 0.0);
        graph.publish_animated(node, goal);
    }

    void SpringDriver::restart_from(channel_vector position, channel_vector velocity, tick_time_t now) {
        _start_position = std::move(position);
        _start_velocity = std::move(velocity);
        _origin = now;
    }

    void SpringDriver::come_to_rest(ReactiveGraph &graph, Node &node) {
        _origin.reset();
        _start_position = _target;
        _start_velocity.assign(_target.size(), 0.0);
        graph.publish_animated(node, _goal);
    }
} // namespace kinetic
