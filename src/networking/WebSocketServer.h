#pragma once

#include "networking/HttpRoutes.h"
#include "networking/MessageSink.h"

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace photorelay::networking {

class WebSocketServer : public MessageSink {
public:
    using OnConnect    = std::function<void(ClientId)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnMessage    = std::function<void(ClientId, const std::string&)>;
    using OnHttp       = std::function<HttpResponse(const HttpRequest&)>;

    struct Options {
        std::string address = "0.0.0.0";
        unsigned short port = 5000;  // 0 picks an ephemeral port
        std::size_t max_message_bytes = 15 * 1024 * 1024;
        std::chrono::seconds handshake_timeout{30};
        // Silence after which the peer is dropped; pings go out at half of it.
        std::chrono::seconds idle_timeout{60};
    };

    WebSocketServer(boost::asio::io_context& ioc, const Options& opts);
    ~WebSocketServer() override;

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Callbacks run on the connection's strand. Set them before start().
    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);
    void set_on_http(OnHttp cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active sessions

    // Queues a text frame. Unknown clients are ignored; throws
    // std::runtime_error once the server is stopped.
    void send(ClientId client, const std::string& msg) override;

    unsigned short port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace photorelay::networking
