#include "relay/RelayHandler.h"

#include "relay/Validator.h"
#include "util/Log.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <limits>

namespace photorelay::relay {

namespace {

constexpr std::string_view kTag = "relay";

constexpr std::string_view kNoSessionId       = "No session ID provided";
constexpr std::string_view kAlreadyRegistered = "Connection already registered";
constexpr std::string_view kDesktopRegistered = "Desktop registered successfully";
constexpr std::string_view kMobileConnected   = "Connected to desktop";
constexpr std::string_view kDesktopNotFound   = "Desktop not found. Please check if the app is running.";
constexpr std::string_view kDesktopNotConnected =
    "Desktop not connected. Please ensure the desktop app is running.";
constexpr std::string_view kNoPhotoData       = "No photo data received";
constexpr std::string_view kInvalidFileSize   = "Invalid file size";
constexpr std::string_view kPhotoSent         = "Photo sent successfully";
constexpr std::string_view kForwardFailed     = "Failed to send photo to desktop";
constexpr std::string_view kInvalidMessage    = "invalid message";

constexpr std::string_view kDefaultMimeType = "image/jpeg";

// Declared size as a signed byte count. Fractional sizes round up so that
// 10 MiB + 0.5 still counts as over the limit.
std::optional<std::int64_t> declared_size(const json::value& v) {
    if (v.is_int64()) return v.get_int64();
    if (v.is_uint64()) {
        auto u = v.get_uint64();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        return static_cast<std::int64_t>(u);
    }
    if (v.is_double()) {
        double d = v.get_double();
        if (!std::isfinite(d)) return std::nullopt;
        if (d >= 9.0e18) return std::numeric_limits<std::int64_t>::max();
        if (d <= -9.0e18) return std::numeric_limits<std::int64_t>::min();
        return static_cast<std::int64_t>(std::ceil(d));
    }
    return std::nullopt;
}

} // namespace

const char* to_string(RelayError err) noexcept {
    switch (err) {
        case RelayError::InvalidSession:      return "InvalidSession";
        case RelayError::MissingPayload:      return "MissingPayload";
        case RelayError::ValidationFailure:   return "ValidationFailure";
        case RelayError::ForwardFailure:      return "ForwardFailure";
        case RelayError::RegistrationFailure: return "RegistrationFailure";
        case RelayError::MalformedMessage:    return "MalformedMessage";
    }
    return "?";
}

OutboundEvent OutboundEvent::to_self(std::string_view name, json::object payload) {
    OutboundEvent ev;
    ev.target = Target::Self;
    ev.name = std::string(name);
    ev.payload = std::move(payload);
    return ev;
}

OutboundEvent OutboundEvent::to_room(std::string room, std::string_view name, json::object payload) {
    OutboundEvent ev;
    ev.target = Target::Room;
    ev.room = std::move(room);
    ev.name = std::string(name);
    ev.payload = std::move(payload);
    return ev;
}

RelayHandler::RelayHandler(SessionRegistry& registry, ConnectionMultiplexer& mux)
    : registry_(registry), mux_(mux) {
    dispatch_.emplace(std::string(events::kRegisterDesktop),
                      [this](const Connection& s, const json::object& d) { return register_desktop(s, d); });
    dispatch_.emplace(std::string(events::kRegisterMobile),
                      [this](const Connection& s, const json::object& d) { return register_mobile(s, d); });
    dispatch_.emplace(std::string(events::kUploadPhoto),
                      [this](const Connection& s, const json::object& d) { return upload_photo(s, d); });
}

// ---- transport callbacks ----

void RelayHandler::on_connect(ClientId id) {
    if (!mux_.on_connect(id)) {
        util::log_warn(kTag) << "duplicate connect for conn " << id;
        return;
    }
    util::log_info(kTag) << "client connected: conn " << id;
}

void RelayHandler::on_disconnect(ClientId id) {
    auto last = mux_.connection(id);
    if (!last || !mux_.on_disconnect(id)) return;

    using std::chrono::duration_cast;
    using std::chrono::seconds;
    auto now = Connection::Clock::now();
    util::log_info(kTag) << "client disconnected: conn " << id << " (" << role_name(last->role)
                         << ", open " << duration_cast<seconds>(last->open_for(now)).count()
                         << "s, idle " << duration_cast<seconds>(last->idle_for(now)).count() << "s)";
}

void RelayHandler::on_message(ClientId id, const std::string& frame) {
    auto state = mux_.touch(id);
    if (!state) {
        util::log_debug(kTag) << "dropping message for closed conn " << id;
        return;
    }

    auto env = decode(frame);
    if (!env) {
        util::log_warn(kTag) << "conn " << id << ": malformed frame (" << frame.size() << " bytes)";
        apply(id, reject(*state, RelayError::MalformedMessage, events::kError, kInvalidMessage));
        return;
    }

    apply(id, handle(*state, *env));
}

// ---- state machine ----

Transition RelayHandler::handle(const Connection& state, const Envelope& env) const {
    auto it = dispatch_.find(env.event);
    if (it == dispatch_.end()) {
        return reject(state, RelayError::MalformedMessage, events::kError,
                      "unknown event: " + env.event);
    }
    return it->second(state, env.data);
}

Transition RelayHandler::reject(const Connection& state, RelayError err,
                                std::string_view event, std::string_view message) {
    Transition t;
    t.next = state.role;
    t.error = err;
    t.events.push_back(OutboundEvent::to_self(event, message_payload(message)));
    return t;
}

Transition RelayHandler::register_desktop(const Connection& state, const json::object& data) const {
    std::string session_id = string_field(data, "session_id");
    if (session_id.empty()) {
        return reject(state, RelayError::RegistrationFailure, events::kRegistrationError, kNoSessionId);
    }
    if (state.role != Role::Unregistered) {
        return reject(state, RelayError::RegistrationFailure, events::kRegistrationError, kAlreadyRegistered);
    }

    Transition t;
    t.next = Role::Desktop;
    t.session_id = session_id;
    t.claim_session = true;
    t.joins.push_back(desktop_room(session_id));
    t.events.push_back(OutboundEvent::to_self(events::kRegistrationOk, message_payload(kDesktopRegistered)));
    return t;
}

Transition RelayHandler::register_mobile(const Connection& state, const json::object& data) const {
    std::string session_id = string_field(data, "session_id");
    if (session_id.empty()) {
        return reject(state, RelayError::RegistrationFailure, events::kRegistrationError, kNoSessionId);
    }
    if (state.role != Role::Unregistered) {
        return reject(state, RelayError::RegistrationFailure, events::kRegistrationError, kAlreadyRegistered);
    }

    // The mobile stays registered even without a desktop; uploads re-check.
    Transition t;
    t.next = Role::Mobile;
    t.session_id = session_id;
    t.joins.push_back(mobile_room(session_id));
    if (registry_.lookup(session_id)) {
        t.events.push_back(OutboundEvent::to_self(events::kRegistrationOk, message_payload(kMobileConnected)));
    } else {
        t.error = RelayError::InvalidSession;
        t.events.push_back(OutboundEvent::to_self(events::kRegistrationError, message_payload(kDesktopNotFound)));
    }
    return t;
}

Transition RelayHandler::upload_photo(const Connection& state, const json::object& data) const {
    std::string session_id = string_field(data, "session_id");
    if (session_id.empty() || !registry_.lookup(session_id)) {
        return reject(state, RelayError::InvalidSession, events::kUploadError, kDesktopNotConnected);
    }

    const json::value* photo = data.if_contains("photo");
    if (!photo || !photo->is_string() || photo->get_string().empty()) {
        return reject(state, RelayError::MissingPayload, events::kUploadError, kNoPhotoData);
    }

    std::string mime_type(kDefaultMimeType);
    if (data.if_contains("mime_type")) mime_type = string_field(data, "mime_type");

    json::value file_size = std::int64_t(0);
    if (auto* v = data.if_contains("file_size")) file_size = *v;

    // The type is checked first, so a bad type wins over an unreadable size.
    auto size = declared_size(file_size);
    if (auto reason = Validator::validate(mime_type, size.value_or(0))) {
        return reject(state, RelayError::ValidationFailure, events::kUploadError, *reason);
    }
    if (!size) {
        return reject(state, RelayError::ValidationFailure, events::kUploadError, kInvalidFileSize);
    }

    json::object forward;
    forward["photo"] = *photo;
    forward["mime_type"] = mime_type;
    forward["file_size"] = file_size;

    Transition t;
    t.next = state.role;
    t.session_id = session_id;
    t.events.push_back(OutboundEvent::to_room(desktop_room(session_id), events::kPhotoReceived,
                                              std::move(forward)));
    t.events.push_back(OutboundEvent::to_self(events::kUploadOk, message_payload(kPhotoSent)));
    t.on_forward_failure = OutboundEvent::to_self(events::kUploadError, message_payload(kForwardFailed));
    return t;
}

// ---- effects ----

void RelayHandler::apply(ClientId id, const Transition& t) {
    if (t.error) {
        util::log_warn(kTag) << "conn " << id << ": " << to_string(*t.error)
                             << (t.session_id.empty() ? "" : " (session " + t.session_id + ")");
    }

    if (t.claim_session) {
        auto claim = mux_.claim_desktop(id, t.session_id);
        if (!claim) return;  // closed while handling
        if (claim->evicted) {
            util::log_info(kTag) << "session " << t.session_id << " taken over by conn " << id
                                 << " from conn " << *claim->evicted;
        }
        util::log_info(kTag) << role_name(t.next) << " registered for session " << t.session_id
                             << " (conn " << id << ")";
    } else {
        auto current = mux_.connection(id);
        if (!current) return;

        if (current->role != t.next) {
            mux_.set_registration(id, t.next, t.session_id);
            util::log_info(kTag) << role_name(t.next) << " registered for session " << t.session_id
                                 << " (conn " << id << ")";
        }
        for (const auto& room : t.joins) {
            mux_.join_room(id, room);
        }
    }

    for (const auto& ev : t.events) {
        if (ev.target == OutboundEvent::Target::Room) {
            try {
                std::size_t n = mux_.emit_to_room(ev.room, ev.name, ev.payload);
                util::log_info(kTag) << ev.name << " relayed to " << ev.room << " (" << n << " member"
                                     << (n == 1 ? "" : "s") << ")";
            } catch (const std::exception& e) {
                util::log_error(kTag) << "error relaying " << ev.name << " to " << ev.room << ": " << e.what();
                if (t.on_forward_failure) {
                    try {
                        mux_.emit_to_conn(id, t.on_forward_failure->name, t.on_forward_failure->payload);
                    } catch (const std::exception& e2) {
                        util::log_error(kTag) << "conn " << id << ": reply failed: " << e2.what();
                    }
                }
                return;
            }
            continue;
        }

        try {
            mux_.emit_to_conn(id, ev.name, ev.payload);
        } catch (const std::exception& e) {
            util::log_error(kTag) << "conn " << id << ": reply " << ev.name << " failed: " << e.what();
            return;
        }
    }
}

} // namespace photorelay::relay
