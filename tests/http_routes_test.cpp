#include <gtest/gtest.h>

#include "networking/HttpRoutes.h"

#include <boost/json.hpp>

using photorelay::networking::HttpRequest;
using photorelay::networking::HttpRoutes;
namespace http = boost::beast::http;
namespace json = boost::json;

namespace {

HttpRequest get(const std::string& target) {
    HttpRequest req{http::verb::get, target, 11};
    req.set(http::field::host, "localhost");
    return req;
}

} // namespace

TEST(HttpRoutes, HealthReportsSessionCount) {
    std::size_t sessions = 3;
    HttpRoutes routes([&] { return sessions; });

    auto res = routes.handle(get("/health"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    auto body = json::parse(res.body()).as_object();
    EXPECT_EQ(body.at("status").as_string(), "healthy");
    EXPECT_EQ(body.at("active_sessions").as_int64(), 3);

    sessions = 0;
    body = json::parse(routes.handle(get("/health")).body()).as_object();
    EXPECT_EQ(body.at("active_sessions").as_int64(), 0);
}

TEST(HttpRoutes, UploadPageEmbedsSession) {
    HttpRoutes routes([] { return std::size_t{0}; });
    auto res = routes.handle(get("/upload?session=abc123"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("data-session=\"abc123\""), std::string::npos);
    EXPECT_EQ(res.body().find("{{SESSION_ID}}"), std::string::npos);
}

TEST(HttpRoutes, UploadPageEscapesSession) {
    HttpRoutes routes([] { return std::size_t{0}; });
    auto res = routes.handle(get("/upload?x=1&session=%22%3E%3Cscript%3E"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("data-session=\"&quot;&gt;&lt;script&gt;\""), std::string::npos);
    EXPECT_EQ(res.body().find("\"><script>"), std::string::npos);
}

TEST(HttpRoutes, UploadWithoutSessionIsBadRequest) {
    HttpRoutes routes([] { return std::size_t{0}; });
    for (auto target : {"/upload", "/upload?session=", "/upload?other=1"}) {
        auto res = routes.handle(get(target));
        EXPECT_EQ(res.result(), http::status::bad_request) << target;
        EXPECT_NE(res.body().find("Invalid Session"), std::string::npos) << target;
    }
}

TEST(HttpRoutes, StatusPageAndUnknownPaths) {
    HttpRoutes routes([] { return std::size_t{0}; });
    EXPECT_EQ(routes.handle(get("/")).result(), http::status::ok);
    EXPECT_EQ(routes.handle(get("/nope")).result(), http::status::not_found);

    HttpRequest post{http::verb::post, "/health", 11};
    EXPECT_EQ(routes.handle(post).result(), http::status::method_not_allowed);
}

TEST(HttpRoutes, ResponsesAllowAnyOrigin) {
    HttpRoutes routes([] { return std::size_t{0}; });
    auto res = routes.handle(get("/health"));
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
}

TEST(HttpRoutes, QueryParsing) {
    EXPECT_EQ(HttpRoutes::query_param("/upload?session=a%20b+c", "session"), std::string("a b c"));
    EXPECT_EQ(HttpRoutes::query_param("/upload?a=1&session=x&b=2", "session"), std::string("x"));
    EXPECT_EQ(HttpRoutes::query_param("/upload?session", "session"), std::string());
    EXPECT_FALSE(HttpRoutes::query_param("/upload", "session"));
    EXPECT_EQ(HttpRoutes::percent_decode("100%"), "100%");
    EXPECT_EQ(HttpRoutes::percent_decode("%zz"), "%zz");
}
