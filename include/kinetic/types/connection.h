#ifndef KINETIC_CONNECTION_H
#define KINETIC_CONNECTION_H

#include <kinetic/kinetic_base.h>
#include <kinetic/types/value/value.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace kinetic {

    using connection_id_t = std::uint64_t;

    /**
     * @brief Ordered list of post-update callbacks.
     *
     * Each node owns one list for its connection callbacks and one for its external bindings. Callbacks are
     * identified by a slot id so a Connection handle can remove exactly the callback it registered.
     *
     * Key characteristics:
     * - Callbacks fire in registration order
     * - Removal during a notification is safe, the removed callback is skipped if it has not fired yet
     * - Safe to notify an empty list (no-op)
     */
    template<typename Fn>
    class CallbackList {
    public:
        connection_id_t add(Fn fn) {
            auto id = ++_next_id;
            _slots.push_back(Slot{id, std::make_shared<Fn>(std::move(fn))});
            return id;
        }

        bool remove(connection_id_t id) {
            for (auto it = _slots.begin(); it != _slots.end(); ++it) {
                if (it->id == id) {
                    _slots.erase(it);
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] bool contains(connection_id_t id) const {
            for (const auto &slot: _slots) {
                if (slot.id == id) { return true; }
            }
            return false;
        }

        /**
         * Invoke op(callback) for every registered callback. Iterates over a snapshot so callbacks may connect or
         * disconnect while the list is being notified.
         */
        template<typename Op>
        void notify(Op &&op) const {
            auto snapshot{_slots};
            for (const auto &slot: snapshot) {
                if (contains(slot.id)) { op(*slot.fn); }
            }
        }

        void clear() { _slots.clear(); }

        [[nodiscard]] bool empty() const { return _slots.empty(); }

        [[nodiscard]] size_t size() const { return _slots.size(); }

    private:
        struct Slot {
            connection_id_t id;
            std::shared_ptr<Fn> fn;
        };

        std::vector<Slot> _slots;
        connection_id_t _next_id{0};
    };

    using ConnectionCallback = std::function<void()>;
    // The external binding hook, receives every settled value of the node.
    using BindingHook = std::function<void(const value::Value &)>;

    /**
     * Handle returned by connect / bind. Disconnecting is idempotent and safe after the node has been destroyed.
     */
    class KINETIC_EXPORT Connection {
    public:
        enum class Kind : uint8_t { Callback, Binding };

        Connection() = default;

        Connection(std::weak_ptr<Node> node, connection_id_t id, Kind kind);

        void disconnect();

        [[nodiscard]] bool connected() const;

        [[nodiscard]] connection_id_t id() const { return _id; }

    private:
        std::weak_ptr<Node> _node;
        connection_id_t _id{0};
        Kind _kind{Kind::Callback};
    };

} // namespace kinetic

#endif // KINETIC_CONNECTION_H
