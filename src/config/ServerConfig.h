#pragma once

#include "networking/WebSocketServer.h"
#include "util/Log.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace photorelay::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 5000;
    unsigned threads = 1;
    std::chrono::seconds ping_timeout{60};
    std::size_t max_message_bytes = 15 * 1024 * 1024;
    util::LogLevel log_level = util::LogLevel::Info;
    bool show_help = false;

    using EnvLookup = std::function<const char*(const char*)>;

    // Defaults, then HOST / PORT / RELAY_* variables, then command-line flags.
    // Throws std::invalid_argument on unknown flags or bad values.
    static ServerConfig load(int argc, const char* const* argv);
    static ServerConfig load(const std::vector<std::string>& args, const EnvLookup& env);

    networking::WebSocketServer::Options transport_options() const;
};

std::string usage(const std::string& program);

} // namespace photorelay::config
