#include "networking/HttpRoutes.h"

#include <boost/json.hpp>

#include <cstdint>
#include <utility>

namespace photorelay::networking {

namespace http = boost::beast::http;
namespace json = boost::json;

namespace {

constexpr const char* kServerName = "photorelay";

constexpr std::string_view kStatusPage = R"(<!DOCTYPE html>
<html>
<head><meta charset="utf-8"><title>Photo Relay</title></head>
<body style="font-family: Arial; text-align: center; padding: 50px;">
    <h2>Photo Relay Server</h2>
    <p>The relay is running. Open the desktop app and scan its QR code to send photos.</p>
    <p><a href="/health">/health</a></p>
</body>
</html>
)";

constexpr std::string_view kInvalidSessionPage = R"(<!DOCTYPE html>
<html>
<head><meta charset="utf-8"><title>Invalid Session</title></head>
<body style="font-family: Arial; text-align: center; padding: 50px;">
    <h2>Invalid Session</h2>
    <p>Please scan the QR code from the desktop app.</p>
</body>
</html>
)";

constexpr std::string_view kSessionPlaceholder = "{{SESSION_ID}}";

// The session id is read from the data attribute, never spliced into script.
constexpr std::string_view kUploadPage = R"(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<title>Send Photo</title>
</head>
<body style="font-family: Arial; text-align: center; padding: 30px;" data-session="{{SESSION_ID}}">
    <h2>Send a photo to your desktop</h2>
    <p id="status">Connecting...</p>
    <input id="file" type="file" accept="image/jpeg,image/png,image/webp" capture="environment">
    <script>
    (function () {
        var session = document.body.dataset.session;
        var status = document.getElementById('status');
        var scheme = location.protocol === 'https:' ? 'wss://' : 'ws://';
        var ws = new WebSocket(scheme + location.host + '/');

        function send(event, data) { ws.send(JSON.stringify({event: event, data: data})); }

        ws.onopen = function () { send('register_mobile', {session_id: session}); };
        ws.onclose = function () { status.textContent = 'Disconnected from server.'; };
        ws.onmessage = function (msg) {
            var frame = JSON.parse(msg.data);
            if (frame.data && frame.data.message) status.textContent = frame.data.message;
        };

        document.getElementById('file').addEventListener('change', function (e) {
            var file = e.target.files[0];
            if (!file) return;
            if (file.size > 10 * 1024 * 1024) { status.textContent = 'File too large (max 10MB)'; return; }
            var reader = new FileReader();
            reader.onload = function () {
                var data = String(reader.result);
                send('upload_photo', {
                    session_id: session,
                    photo: data.substring(data.indexOf(',') + 1),
                    mime_type: file.type,
                    file_size: file.size
                });
                status.textContent = 'Uploading...';
            };
            reader.readAsDataURL(file);
        });
    })();
    </script>
</body>
</html>
)";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

HttpRoutes::HttpRoutes(SessionCount active_sessions)
    : active_sessions_(std::move(active_sessions)) {}

HttpResponse HttpRoutes::handle(const HttpRequest& req) const {
    std::string_view target(req.target().data(), req.target().size());
    std::string_view path = target.substr(0, target.find('?'));

    if (req.method() != http::verb::get) {
        auto res = make_response(req, http::status::method_not_allowed, "text/plain", "method not allowed\n");
        res.set(http::field::allow, "GET");
        return res;
    }

    if (path == "/") return status_page(req);
    if (path == "/upload") return upload_page(req);
    if (path == "/health") return health(req);

    return make_response(req, http::status::not_found, "text/plain", "not found\n");
}

HttpResponse HttpRoutes::status_page(const HttpRequest& req) const {
    return make_response(req, http::status::ok, "text/html; charset=utf-8", std::string(kStatusPage));
}

HttpResponse HttpRoutes::upload_page(const HttpRequest& req) const {
    std::string_view target(req.target().data(), req.target().size());
    auto session_id = query_param(target, "session");
    if (!session_id || session_id->empty()) {
        return make_response(req, http::status::bad_request, "text/html; charset=utf-8",
                             std::string(kInvalidSessionPage));
    }

    std::string body(kUploadPage);
    body.replace(body.find(kSessionPlaceholder), kSessionPlaceholder.size(), html_escape(*session_id));
    return make_response(req, http::status::ok, "text/html; charset=utf-8", std::move(body));
}

HttpResponse HttpRoutes::health(const HttpRequest& req) const {
    json::object body{
        {"status", "healthy"},
        {"active_sessions", static_cast<std::uint64_t>(active_sessions_ ? active_sessions_() : 0)}
    };
    return make_response(req, http::status::ok, "application/json", json::serialize(body));
}

HttpResponse HttpRoutes::make_response(const HttpRequest& req, http::status status,
                                       const char* content_type, std::string body) {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, content_type);
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

std::optional<std::string> HttpRoutes::query_param(std::string_view target, std::string_view key) {
    auto q = target.find('?');
    if (q == std::string_view::npos) return std::nullopt;

    std::string_view query = target.substr(q + 1);
    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        auto eq = pair.find('=');
        std::string name = percent_decode(pair.substr(0, eq));
        if (name != key) continue;
        if (eq == std::string_view::npos) return std::string();
        return percent_decode(pair.substr(eq + 1));
    }
    return std::nullopt;
}

std::string HttpRoutes::percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string HttpRoutes::html_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out.push_back(c);
        }
    }
    return out;
}

} // namespace photorelay::networking
