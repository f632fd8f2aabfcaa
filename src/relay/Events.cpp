#include "relay/Events.h"

namespace photorelay::relay {

std::string encode(std::string_view event, const json::object& data) {
    json::object frame;
    frame["event"] = to_json(event);
    frame["data"] = data;
    return json::serialize(frame);
}

std::optional<Envelope> decode(std::string_view frame) {
    json::error_code ec;
    json::value v = json::parse(to_json(frame), ec);
    if (ec) return std::nullopt;

    auto* obj = v.if_object();
    if (!obj) return std::nullopt;

    auto* name = obj->if_contains("event");
    if (!name || !name->is_string()) return std::nullopt;

    Envelope env;
    env.event = json::value_to<std::string>(*name);
    if (auto* data = obj->if_contains("data"); data && data->is_object()) {
        env.data = std::move(data->as_object());
    }
    return env;
}

std::string string_field(const json::object& obj, std::string_view key) {
    auto* v = obj.if_contains(to_json(key));
    if (!v || !v->is_string()) return {};
    return json::value_to<std::string>(*v);
}

json::object message_payload(std::string_view text) {
    json::object payload;
    payload["message"] = to_json(text);
    return payload;
}

} // namespace photorelay::relay
