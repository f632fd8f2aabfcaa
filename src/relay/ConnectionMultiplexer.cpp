#include "relay/ConnectionMultiplexer.h"

#include "util/Log.hpp"

namespace photorelay::relay {

ConnectionMultiplexer::ConnectionMultiplexer(SessionRegistry& registry,
                                             networking::MessageSink& sink)
    : registry_(registry), sink_(sink) {}

bool ConnectionMultiplexer::on_connect(ClientId id) {
    Connection conn;
    conn.id = id;
    conn.connected_at = Connection::Clock::now();
    conn.last_seen = conn.connected_at;

    std::lock_guard<std::mutex> lk(mu_);
    return connections_.emplace(id, std::move(conn)).second;
}

bool ConnectionMultiplexer::on_disconnect(ClientId id) {
    Connection conn;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = connections_.find(id);
        if (it == connections_.end()) return false;

        conn = std::move(it->second);
        connections_.erase(it);

        for (const auto& room : conn.rooms) {
            auto rit = rooms_.find(room);
            if (rit == rooms_.end()) continue;
            rit->second.erase(id);
            if (rit->second.empty()) rooms_.erase(rit);
        }
    }

    if (conn.role == Role::Desktop) {
        for (const auto& session_id : registry_.unregister_by_conn(id)) {
            util::log_info("mux") << "removed session " << session_id << " (conn " << id << ")";
        }
    }
    return true;
}

bool ConnectionMultiplexer::join_room(ClientId id, const std::string& room) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it == connections_.end()) return false;

    it->second.rooms.insert(room);
    rooms_[room].insert(id);
    return true;
}

bool ConnectionMultiplexer::leave_room(ClientId id, const std::string& room) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it == connections_.end()) return false;
    if (it->second.rooms.count(room) == 0) return false;

    leave_room_locked(id, room);
    return true;
}

void ConnectionMultiplexer::leave_room_locked(ClientId id, const std::string& room) {
    auto it = connections_.find(id);
    if (it != connections_.end()) it->second.rooms.erase(room);

    auto rit = rooms_.find(room);
    if (rit == rooms_.end()) return;
    rit->second.erase(id);
    if (rit->second.empty()) rooms_.erase(rit);
}

// Lock order is mux_ then the registry's own lock; the registry never calls back.
std::optional<ConnectionMultiplexer::DesktopClaim>
ConnectionMultiplexer::claim_desktop(ClientId id, const std::string& session_id) {
    const std::string room = desktop_room(session_id);

    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it == connections_.end()) return std::nullopt;

    DesktopClaim claim;
    auto previous = registry_.register_session(session_id, id);
    if (previous && *previous != id) claim.evicted = previous;

    // Anything else still in the room lost the registry race.
    auto rit = rooms_.find(room);
    if (rit != rooms_.end()) {
        std::vector<ClientId> stale(rit->second.begin(), rit->second.end());
        for (ClientId other : stale) {
            if (other != id) leave_room_locked(other, room);
        }
    }

    it->second.role = Role::Desktop;
    it->second.session_id = session_id;
    it->second.rooms.insert(room);
    rooms_[room].insert(id);
    return claim;
}

bool ConnectionMultiplexer::set_registration(ClientId id, Role role, const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it == connections_.end()) return false;

    it->second.role = role;
    it->second.session_id = session_id;
    return true;
}

std::optional<Connection> ConnectionMultiplexer::touch(ClientId id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it == connections_.end()) return std::nullopt;

    it->second.touch();
    return it->second;
}

std::optional<Connection> ConnectionMultiplexer::connection(ClientId id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it == connections_.end()) return std::nullopt;
    return it->second;
}

std::size_t ConnectionMultiplexer::emit_to_room(const std::string& room, std::string_view event,
                                                const json::object& payload) {
    std::vector<ClientId> members = room_members(room);
    if (members.empty()) return 0;

    const std::string frame = encode(event, payload);
    for (ClientId id : members) {
        sink_.send(id, frame);
    }
    return members.size();
}

void ConnectionMultiplexer::emit_to_conn(ClientId id, std::string_view event,
                                         const json::object& payload) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (connections_.find(id) == connections_.end()) return;
    }
    sink_.send(id, encode(event, payload));
}

std::vector<ClientId> ConnectionMultiplexer::room_members(const std::string& room) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = rooms_.find(room);
    if (it == rooms_.end()) return {};
    return std::vector<ClientId>(it->second.begin(), it->second.end());
}

std::size_t ConnectionMultiplexer::connection_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return connections_.size();
}

} // namespace photorelay::relay
