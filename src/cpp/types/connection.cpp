#include <kinetic/types/connection.h>
#include <kinetic/types/node.h>

namespace kinetic {
    Connection::Connection(std::weak_ptr<Node> node, connection_id_t id, Kind kind)
        : _node{std::move(node)}, _id{id}, _kind{kind} {
    }

    void Connection::disconnect() {
        if (auto node = _node.lock()) {
            if (_kind == Kind::Binding) {
                node->_bindings.remove(_id);
            } else {
                node->_connections.remove(_id);
            }
        }
        _node.reset();
    }

    bool Connection::connected() const {
        auto node = _node.lock();
        if (!node) { return false; }
        return _kind == Kind::Binding ? node->_bindings.contains(_id) : node->_connections.contains(_id);
    }
} // namespace kinetic
