#include <kinetic/animation/tween.h>
#include <kinetic/runtime/reactive_graph.h>

namespace kinetic {
    TweenDriver::TweenDriver(TweenProfile profile) : _profile{profile}, _repeats_left{profile.repeat_count} {
    }

    void TweenDriver::on_write(ReactiveGraph &graph, Node &node, value::Value goal) {
        // Interrupting a running tween starts the new one from wherever the node is now
        _start = node.value();
        _goal = std::move(goal);
        _origin = graph.now() + _profile.delay;
        _repeats_left = _profile.repeat_count;
    }

    void TweenDriver::step(ReactiveGraph &graph, Node &node, tick_time_t now) {
        if (!_origin) { return; }
        const double elapsed = (now - *_origin).count();
        if (elapsed < 0.0) { return; }

        const double duration = _profile.duration.count();
        const double span = _profile.reverses ? 2.0 : 1.0;
        const double alpha = duration > 0.0 ? elapsed / duration : span;

        if (alpha >= span) {
            if (_repeats_left != 0) {
                // The next repetition starts over, its first frame is the start value
                if (_repeats_left > 0) { --_repeats_left; }
                _origin = now + _profile.delay;
                graph.publish_animated(node, _start);
                return;
            }
            _origin.reset();
            graph.publish_animated(node, _profile.reverses ? _start : _goal);
            return;
        }

        const double phase = alpha > 1.0 ? 2.0 - alpha : alpha;
        const double eased = ease(_profile.style, _profile.direction, phase);
        graph.publish_animated(node, graph.interpolator()(_start, _goal, eased));
    }
} // namespace kinetic
