#ifndef KINETIC_SPRING_H
#define KINETIC_SPRING_H

#include <kinetic/animation/animation_driver.h>
#include <kinetic/animation/channel_codec.h>

#include <optional>
#include <utility>

namespace kinetic {

    /**
     * Closed-form response of a unit damped harmonic oscillator after `time` seconds.
     *
     *   displacement(t) = displacement(0) * pos_pos + velocity(0) * pos_vel
     *   velocity(t)     = displacement(0) * vel_pos + velocity(0) * vel_vel
     */
    struct SpringCoefficients {
        double pos_pos;
        double pos_vel;
        double vel_pos;
        double vel_vel;
    };

    [[nodiscard]] KINETIC_EXPORT SpringCoefficients spring_coefficients(double time, double damping, double speed);

    /**
     * Where a spring parameter comes from: a constant or another node whose raw value is sampled every tick.
     * Sampling never registers a dependency edge.
     */
    class KINETIC_EXPORT SpringSource {
    public:
        SpringSource() = default;

        template<typename T>
            requires (!std::is_same_v<std::remove_cvref_t<T>, node_s_ptr> &&
                      !std::is_same_v<std::remove_cvref_t<T>, value::Value> &&
                      !std::is_same_v<std::remove_cvref_t<T>, SpringSource>)
        SpringSource(T constant) : _constant{value::Value{std::move(constant)}} {
        }

        SpringSource(value::Value constant) : _constant{std::move(constant)} {
        }

        SpringSource(node_s_ptr node) : _node{std::move(node)} {
        }

        [[nodiscard]] bool is_node() const { return _node != nullptr; }

        [[nodiscard]] bool is_set() const { return _node != nullptr || _constant.has_value(); }

        [[nodiscard]] const value::Value &sample() const;

    private:
        value::Value _constant;
        node_s_ptr _node;
    };

    struct SpringOptions {
        // When unset the spring rests at the node's current value until the node is written.
        SpringSource goal{};
        // Angular speed (rad/s) and damping ratio, numeric constants or nodes holding numbers.
        SpringSource speed{10.0};
        SpringSource damping{1.0};
    };

    /**
     * Drives a node along the closed-form trajectory of a damped spring towards its goal, one oscillator per
     * codec channel.
     *
     * The driver stores the trajectory's start (position and velocity) and the time it started; every tick the
     * current state is evaluated analytically from those, nothing is integrated incrementally. Retargeting
     * captures the current state as the new start so the motion stays continuous.
     */
    class KINETIC_EXPORT SpringDriver final : public AnimationDriver {
    public:
        SpringDriver(SpringOptions options, double rest_epsilon);

        // Takes the first sample of the goal, snapping the node to it.
        void initialise(ReactiveGraph &graph, Node &node);

        void on_write(ReactiveGraph &graph, Node &node, value::Value goal) override;

        void step(ReactiveGraph &graph, Node &node, tick_time_t now) override;

        [[nodiscard]] bool is_animating() const override { return _origin.has_value(); }

        [[nodiscard]] const char *kind() const override { return "spring"; }

        void set_position(ReactiveGraph &graph, Node &node, const value::Value &position);

        void set_velocity(ReactiveGraph &graph, Node &node, const value::Value &velocity);

        void add_velocity(ReactiveGraph &graph, Node &node, const value::Value &velocity);

        // Position and velocity channels at `now`, evaluated from the current trajectory.
        [[nodiscard]] std::pair<channel_vector, channel_vector> state_at(tick_time_t now) const;

        [[nodiscard]] const channel_vector &target() const { return _target; }

        [[nodiscard]] const channel_vector &start_position() const { return _start_position; }

        [[nodiscard]] const channel_vector &start_velocity() const { return _start_velocity; }

        [[nodiscard]] const tick_origin_t &origin() const { return _origin; }

        [[nodiscard]] double speed() const { return _speed; }

        [[nodiscard]] double damping() const { return _damping; }

    private:
        void sample(ReactiveGraph &graph, Node &node, tick_time_t now);

        [[nodiscard]] double sample_parameter(ReactiveGraph &graph, const Node &node, const SpringSource &source,
                                              const char *what, double last) const;

        void retarget(ReactiveGraph &graph, Node &node, const value::Value &goal, tick_time_t now);

        void snap(ReactiveGraph &graph, Node &node, const value::Value &goal);

        void restart_from(channel_vector position, channel_vector velocity, tick_time_t now);

        void come_to_rest(ReactiveGraph &graph, Node &node);

        SpringOptions _options;
        double _epsilon;

        value::Value _goal;
        const value::TypeMeta *_type{nullptr};
        channel_vector _target;
        channel_vector _start_position;
        channel_vector _start_velocity;
        double _speed{10.0};
        double _damping{1.0};
        tick_origin_t _origin;
    };

} // namespace kinetic

#endif // KINETIC_SPRING_H
