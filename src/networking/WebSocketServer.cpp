#include "networking/WebSocketServer.h"

#include "util/Log.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>

namespace photorelay::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
constexpr std::size_t kMaxHttpBody = 64 * 1024;
constexpr const char* kServerName = "photorelay";
}

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, const Options& opts)
        : ioc_(ioc),
          opts_(opts),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(opts.address), opts.port)) {}

    void start() { do_accept(); }

    void stop() {
        stopped_ = true;

        beast::error_code ec;
        acceptor_.close(ec);

        // Close all sessions
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, s] : sessions_) {
            s->close();
        }
        sessions_.clear();
    }

    void send(ClientId client, const std::string& msg) {
        if (stopped_) throw std::runtime_error("websocket server is stopped");

        std::shared_ptr<Session> s;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = sessions_.find(client);
            if (it == sessions_.end()) return;
            s = it->second;
        }
        s->send(msg);
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }
    void set_on_http(OnHttp cb) { on_http_ = std::move(cb); }

private:
    // WebSocket connection after the upgrade. All handlers run on the
    // socket's strand, so callbacks for one client never overlap.
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(Impl& server, tcp::socket socket, ClientId id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)),
              strand_(ws_.get_executor()) {}

        void start(HttpRequest req) {
            websocket::stream_base::timeout opt{
                server_.opts_.handshake_timeout,
                server_.opts_.idle_timeout,
                true  // keep-alive pings
            };
            ws_.set_option(opt);
            ws_.set_option(websocket::stream_base::decorator(
                [](websocket::response_type& res) { res.set(http::field::server, kServerName); }));
            ws_.read_message_max(server_.opts_.max_message_bytes);

            req_ = std::move(req);
            ws_.async_accept(
                req_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) {
                            self->fail("accept", ec);
                            self->server_.remove_session(self->id_);
                            return;
                        }

                        if (self->server_.on_connect_) self->server_.on_connect_(self->id_);
                        self->do_read();
                    }));
        }

        void send(const std::string& msg) {
            asio::post(
                strand_,
                [self = shared_from_this(), msg] {
                    if (self->closed_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing) self->do_write();
                });
        }

        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    if (self->closed_) return;
                    self->ws_.async_close(
                        websocket::close_code::normal,
                        asio::bind_executor(self->strand_, [self](beast::error_code) {}));
                });
        }

    private:
        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);

                        self->do_read();
                    }));
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) self->do_write();
                    }));
        }

        // Reads and writes can both fail for one broken socket; report once.
        void on_close_or_fail(beast::error_code ec) {
            if (closed_) return;
            closed_ = true;
            write_queue_.clear();

            // WebSocket close is common; treat it as disconnect.
            if (ec != websocket::error::closed) fail("io", ec);

            server_.remove_session(id_);
            if (server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            util::log_warn("conn " + std::to_string(id_)) << what << ": " << ec.message();
        }

        Impl& server_;
        ClientId id_;

        websocket::stream<beast::tcp_stream> ws_;
        beast::tcp_stream::executor_type strand_;

        HttpRequest req_;
        beast::flat_buffer buffer_;
        std::deque<std::string> write_queue_;
        bool closed_ = false;
    };

    // Plain HTTP until the client asks for a WebSocket upgrade.
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(Impl& server, tcp::socket socket)
            : server_(server), stream_(std::move(socket)) {}

        void start() { do_read(); }

    private:
        void do_read() {
            parser_.emplace();
            parser_->body_limit(kMaxHttpBody);
            stream_.expires_after(server_.opts_.handshake_timeout);

            http::async_read(
                stream_, buffer_, *parser_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    self->on_read(ec);
                });
        }

        void on_read(beast::error_code ec) {
            if (ec == http::error::end_of_stream) return do_close();
            if (ec) {
                if (ec != beast::error::timeout) {
                    util::log_warn("http") << "read: " << ec.message();
                }
                return;
            }

            if (websocket::is_upgrade(parser_->get())) {
                stream_.expires_never();
                server_.upgrade(stream_.release_socket(), parser_->release());
                return;
            }

            auto res = std::make_shared<HttpResponse>(server_.handle_http(parser_->get()));
            util::log_info("http") << parser_->get().method_string() << " "
                                   << parser_->get().target() << " -> " << res->result_int();

            http::async_write(
                stream_, *res,
                [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                    if (ec) {
                        util::log_warn("http") << "write: " << ec.message();
                        return;
                    }
                    if (res->need_eof()) return self->do_close();
                    self->do_read();
                });
        }

        void do_close() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        Impl& server_;
        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
    };

    void do_accept() {
        acceptor_.async_accept(
            asio::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    util::log_error("accept") << ec.message();
                    return do_accept();
                }

                std::make_shared<HttpSession>(*this, std::move(socket))->start();
                do_accept();
            });
    }

    void upgrade(tcp::socket socket, HttpRequest req) {
        auto id = next_client_id_++;
        auto session = std::make_shared<Session>(*this, std::move(socket), id);

        {
            std::lock_guard<std::mutex> lk(mu_);
            sessions_[id] = session;
        }

        session->start(std::move(req));
    }

    HttpResponse handle_http(const HttpRequest& req) {
        try {
            if (on_http_) return on_http_(req);
        } catch (const std::exception& e) {
            util::log_error("http") << "handler failed: " << e.what();
            HttpResponse res{http::status::internal_server_error, req.version()};
            res.set(http::field::server, kServerName);
            res.set(http::field::content_type, "text/plain");
            res.keep_alive(false);
            res.body() = "internal server error\n";
            res.prepare_payload();
            return res;
        }

        HttpResponse res{http::status::not_found, req.version()};
        res.set(http::field::server, kServerName);
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        return res;
    }

    void remove_session(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_.erase(id);
    }

private:
    asio::io_context& ioc_;
    Options opts_;
    tcp::acceptor acceptor_;

    std::atomic<ClientId> next_client_id_{1};
    std::atomic<bool> stopped_{false};

    std::mutex mu_;
    std::unordered_map<ClientId, std::shared_ptr<Session>> sessions_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
    OnHttp on_http_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, const Options& opts)
    : impl_(new Impl(ioc, opts)) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }
void WebSocketServer::set_on_http(OnHttp cb) { impl_->set_on_http(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

void WebSocketServer::send(ClientId client, const std::string& msg) { impl_->send(client, msg); }

unsigned short WebSocketServer::port() const { return impl_->port(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace photorelay::networking
