#include "relay/SessionRegistry.h"

namespace photorelay::relay {

std::optional<ClientId> SessionRegistry::register_session(const std::string& session_id,
                                                          ClientId desktop) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        sessions_.emplace(session_id, Entry{desktop, Clock::now()});
        return std::nullopt;
    }

    ClientId previous = it->second.desktop;
    // Re-registration by a new desktop starts a new session.
    if (previous != desktop) it->second = Entry{desktop, Clock::now()};
    return previous;
}

std::optional<ClientId> SessionRegistry::lookup(const std::string& session_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.desktop;
}

std::optional<SessionRegistry::Entry> SessionRegistry::entry(const std::string& session_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> SessionRegistry::unregister_by_conn(ClientId desktop) {
    std::vector<std::string> removed;

    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.desktop == desktop) {
            removed.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

} // namespace photorelay::relay
