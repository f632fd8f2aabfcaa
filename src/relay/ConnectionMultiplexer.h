#pragma once

#include "networking/MessageSink.h"
#include "relay/Connection.hpp"
#include "relay/Events.h"
#include "relay/SessionRegistry.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace photorelay::relay {

// Live connections, their roles and room memberships. Outbound events go
// through the MessageSink; sends happen outside the internal lock.
class ConnectionMultiplexer {
public:
    ConnectionMultiplexer(SessionRegistry& registry, networking::MessageSink& sink);

    ConnectionMultiplexer(const ConnectionMultiplexer&) = delete;
    ConnectionMultiplexer& operator=(const ConnectionMultiplexer&) = delete;

    // The handle is allocated by the transport; this records it as unregistered.
    // Returns false if the handle is already known.
    bool on_connect(ClientId id);

    // Drops the connection and its memberships; a desktop also loses its
    // sessions. Returns false for unknown or already disconnected handles.
    bool on_disconnect(ClientId id);

    bool join_room(ClientId id, const std::string& room);
    bool leave_room(ClientId id, const std::string& room);

    struct DesktopClaim {
        std::optional<ClientId> evicted;   // previous desktop, dropped from the room
    };

    // Binds `session_id` to `id` in the registry, makes `id` the only member
    // of its desktop room and marks it a desktop, all under one lock so that
    // racing registrations for the same id end with a single room member.
    // Returns nullopt, without touching the registry, if the handle is gone.
    std::optional<DesktopClaim> claim_desktop(ClientId id, const std::string& session_id);

    // Role change for a live connection; false if the handle is gone.
    bool set_registration(ClientId id, Role role, const std::string& session_id);

    // Snapshot of a live connection; also refreshes its last-seen time.
    std::optional<Connection> touch(ClientId id);
    std::optional<Connection> connection(ClientId id) const;

    // Returns the number of members the event was handed to. Transport
    // exceptions propagate to the caller.
    std::size_t emit_to_room(const std::string& room, std::string_view event,
                             const json::object& payload);
    void emit_to_conn(ClientId id, std::string_view event, const json::object& payload);

    std::vector<ClientId> room_members(const std::string& room) const;
    std::size_t connection_count() const;

private:
    void leave_room_locked(ClientId id, const std::string& room);

    SessionRegistry& registry_;
    networking::MessageSink& sink_;

    mutable std::mutex mu_;
    std::unordered_map<ClientId, Connection> connections_;
    std::unordered_map<std::string, std::unordered_set<ClientId>> rooms_;
};

} // namespace photorelay::relay
