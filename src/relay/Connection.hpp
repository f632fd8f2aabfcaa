#pragma once

#include "networking/MessageSink.h"

#include <chrono>
#include <set>
#include <string>

namespace photorelay::relay {

enum class Role { Unregistered, Desktop, Mobile };

inline const char* role_name(Role role) noexcept {
    switch (role) {
        case Role::Unregistered: return "unregistered";
        case Role::Desktop:      return "desktop";
        case Role::Mobile:       return "mobile";
    }
    return "?";
}

struct Connection {
    using Clock = std::chrono::steady_clock;

    networking::ClientId id = 0;
    Role role = Role::Unregistered;
    std::string session_id;           // set once registered
    std::set<std::string> rooms;      // "desktop:<id>" / "mobile:<id>"

    Clock::time_point connected_at{};
    Clock::time_point last_seen{};

    void touch() noexcept { last_seen = Clock::now(); }

    Clock::duration idle_for(Clock::time_point now) const noexcept { return now - last_seen; }
    Clock::duration open_for(Clock::time_point now) const noexcept { return now - connected_at; }
};

inline std::string desktop_room(const std::string& session_id) { return "desktop:" + session_id; }
inline std::string mobile_room(const std::string& session_id)  { return "mobile:" + session_id; }

} // namespace photorelay::relay
