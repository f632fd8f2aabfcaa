#pragma once

#include "networking/MessageSink.h"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace photorelay::relay {

using networking::ClientId;

// Maps a session id to the one desktop connection registered for it.
// All members are safe to call from any connection's strand.
class SessionRegistry {
public:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        ClientId desktop;
        Clock::time_point created_at;
    };

    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Last registration wins. Returns the desktop that held the id before,
    // if any (may equal `desktop` when the same connection registers twice).
    std::optional<ClientId> register_session(const std::string& session_id, ClientId desktop);

    std::optional<ClientId> lookup(const std::string& session_id) const;
    std::optional<Entry> entry(const std::string& session_id) const;

    // Removes every session owned by `desktop`. Returns the removed ids.
    std::vector<std::string> unregister_by_conn(ClientId desktop);

    std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, Entry> sessions_;
};

} // namespace photorelay::relay
