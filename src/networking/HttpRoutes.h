#pragma once

#include <boost/beast/http.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace photorelay::networking {

using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Plain HTTP side of the relay: status page, mobile capture page, health.
class HttpRoutes {
public:
    using SessionCount = std::function<std::size_t()>;

    explicit HttpRoutes(SessionCount active_sessions);

    HttpResponse handle(const HttpRequest& req) const;

    // Value of `key` in the query string of `target`, percent-decoded.
    static std::optional<std::string> query_param(std::string_view target, std::string_view key);
    static std::string percent_decode(std::string_view s);
    static std::string html_escape(std::string_view s);

private:
    HttpResponse status_page(const HttpRequest& req) const;
    HttpResponse upload_page(const HttpRequest& req) const;
    HttpResponse health(const HttpRequest& req) const;

    static HttpResponse make_response(const HttpRequest& req, boost::beast::http::status status,
                                      const char* content_type, std::string body);

    SessionCount active_sessions_;
};

} // namespace photorelay::networking
