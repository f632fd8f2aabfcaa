#pragma once

#include "relay/Connection.hpp"
#include "relay/ConnectionMultiplexer.h"
#include "relay/Events.h"
#include "relay/SessionRegistry.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace photorelay::relay {

enum class RelayError {
    InvalidSession,       // empty or unknown session id
    MissingPayload,       // upload without photo data
    ValidationFailure,    // bad mime type or declared size
    ForwardFailure,       // transport error while relaying to the desktop
    RegistrationFailure,  // register_* without id, or twice on one connection
    MalformedMessage,     // not an envelope, or unknown event
};

const char* to_string(RelayError err) noexcept;

struct OutboundEvent {
    enum class Target { Self, Room };

    Target target = Target::Self;
    std::string room;  // Target::Room only
    std::string name;
    json::object payload;

    static OutboundEvent to_self(std::string_view name, json::object payload);
    static OutboundEvent to_room(std::string room, std::string_view name, json::object payload);
};

// Result of handling one inbound event for one connection. Produced without
// side effects beyond registry lookups; RelayHandler::apply carries it out.
struct Transition {
    Role next = Role::Unregistered;
    std::string session_id;
    bool claim_session = false;  // bind session_id to this connection as its desktop
    std::vector<std::string> joins;
    std::vector<OutboundEvent> events;

    // Replaces the remaining events if a room emit throws.
    std::optional<OutboundEvent> on_forward_failure;

    std::optional<RelayError> error;
};

class RelayHandler {
public:
    using Handler = std::function<Transition(const Connection&, const json::object&)>;

    RelayHandler(SessionRegistry& registry, ConnectionMultiplexer& mux);

    RelayHandler(const RelayHandler&) = delete;
    RelayHandler& operator=(const RelayHandler&) = delete;

    // Transport callbacks. Each is invoked on the connection's own strand.
    void on_connect(ClientId id);
    void on_disconnect(ClientId id);
    void on_message(ClientId id, const std::string& frame);

    // Pure state machine step; unknown events yield an "error" reply.
    Transition handle(const Connection& state, const Envelope& env) const;

    void apply(ClientId id, const Transition& t);

private:
    Transition register_desktop(const Connection& state, const json::object& data) const;
    Transition register_mobile(const Connection& state, const json::object& data) const;
    Transition upload_photo(const Connection& state, const json::object& data) const;

    static Transition reject(const Connection& state, RelayError err,
                             std::string_view event, std::string_view message);

    SessionRegistry& registry_;
    ConnectionMultiplexer& mux_;
    std::unordered_map<std::string, Handler> dispatch_;
};

} // namespace photorelay::relay
