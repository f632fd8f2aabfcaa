#pragma once

#include <boost/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace photorelay::relay {

namespace json = boost::json;

// Event names on the WebSocket channel.
namespace events {
inline constexpr std::string_view kRegisterDesktop    = "register_desktop";
inline constexpr std::string_view kRegisterMobile     = "register_mobile";
inline constexpr std::string_view kRegistrationOk     = "registration_success";
inline constexpr std::string_view kRegistrationError  = "registration_error";
inline constexpr std::string_view kUploadPhoto        = "upload_photo";
inline constexpr std::string_view kUploadOk           = "upload_success";
inline constexpr std::string_view kUploadError        = "upload_error";
inline constexpr std::string_view kPhotoReceived      = "photo_received";
inline constexpr std::string_view kError              = "error";
} // namespace events

// One frame: {"event": <name>, "data": {...}}
struct Envelope {
    std::string event;
    json::object data;
};

std::string encode(std::string_view event, const json::object& data);

// Returns nothing if the frame is not a JSON object with a string "event".
// A missing or non-object "data" decodes as an empty object.
std::optional<Envelope> decode(std::string_view frame);

// Payload helpers. A missing key or a value of the wrong type reads as empty.
std::string string_field(const json::object& obj, std::string_view key);

json::object message_payload(std::string_view text);

inline json::string_view to_json(std::string_view s) { return json::string_view(s.data(), s.size()); }

} // namespace photorelay::relay
