#include "config/ServerConfig.h"
#include "networking/HttpRoutes.h"
#include "networking/WebSocketServer.h"
#include "relay/ConnectionMultiplexer.h"
#include "relay/RelayHandler.h"
#include "relay/SessionRegistry.h"
#include "util/Log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <iostream>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    using namespace photorelay;

    config::ServerConfig cfg;
    try {
        cfg = config::ServerConfig::load(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[PhotoRelay] " << e.what() << "\n" << config::usage(argv[0]);
        return 1;
    }
    if (cfg.show_help) {
        std::cout << config::usage(argv[0]);
        return 0;
    }
    util::Log::set_level(cfg.log_level);

    boost::asio::io_context ioc(static_cast<int>(cfg.threads));

    try {
        relay::SessionRegistry registry;
        networking::WebSocketServer server(ioc, cfg.transport_options());
        relay::ConnectionMultiplexer mux(registry, server);
        relay::RelayHandler handler(registry, mux);
        networking::HttpRoutes routes([&registry] { return registry.size(); });

        server.set_on_connect([&](networking::ClientId id) { handler.on_connect(id); });
        server.set_on_disconnect([&](networking::ClientId id) { handler.on_disconnect(id); });
        server.set_on_message([&](networking::ClientId id, const std::string& msg) {
            handler.on_message(id, msg);
        });
        server.set_on_http([&](const networking::HttpRequest& req) { return routes.handle(req); });

        server.start();

        // Graceful shutdown on Ctrl+C / SIGTERM
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            util::log_info("PhotoRelay") << "shutting down...";
            server.stop();
            ioc.stop();
        });

        util::log_info("PhotoRelay") << "relay running on " << cfg.host << ":" << server.port()
                                     << " (" << cfg.threads << " thread" << (cfg.threads == 1 ? "" : "s") << ")";

        std::vector<std::thread> workers;
        workers.reserve(cfg.threads - 1);
        for (unsigned i = 1; i < cfg.threads; ++i) {
            workers.emplace_back([&ioc] { ioc.run(); });
        }
        ioc.run();
        for (auto& t : workers) t.join();
    } catch (const std::exception& e) {
        util::log_error("PhotoRelay") << e.what();
        return 1;
    }

    util::log_info("PhotoRelay") << "exit.";
    return 0;
}
