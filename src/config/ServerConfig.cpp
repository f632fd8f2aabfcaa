#include "config/ServerConfig.h"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <utility>

namespace photorelay::config {

namespace {

unsigned long parse_number(const std::string& name, const std::string& value,
                           unsigned long min, unsigned long max) {
    std::size_t pos = 0;
    unsigned long n = 0;
    try {
        if (!value.empty() && value[0] == '-') throw std::invalid_argument(value);
        n = std::stoul(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + ": not a number: '" + value + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument(name + ": not a number: '" + value + "'");
    }
    if (n < min || n > max) {
        throw std::invalid_argument(name + ": must be between " + std::to_string(min) +
                                    " and " + std::to_string(max));
    }
    return n;
}

void set_option(ServerConfig& cfg, const std::string& name, const std::string& value) {
    if (name == "host") {
        if (value.empty()) throw std::invalid_argument("host: must not be empty");
        cfg.host = value;
    } else if (name == "port") {
        cfg.port = static_cast<unsigned short>(
            parse_number(name, value, 0, std::numeric_limits<unsigned short>::max()));
    } else if (name == "threads") {
        cfg.threads = static_cast<unsigned>(parse_number(name, value, 1, 256));
    } else if (name == "ping-timeout") {
        cfg.ping_timeout = std::chrono::seconds(parse_number(name, value, 2, 3600));
    } else if (name == "max-message-mb") {
        cfg.max_message_bytes = parse_number(name, value, 11, 1024) * 1024 * 1024;
    } else if (name == "log-level") {
        if (!util::Log::parse_level(value, cfg.log_level)) {
            throw std::invalid_argument("log-level: expected debug, info, warn or error");
        }
    } else {
        throw std::invalid_argument("unknown option --" + name);
    }
}

} // namespace

ServerConfig ServerConfig::load(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return load(args, [](const char* name) { return std::getenv(name); });
}

ServerConfig ServerConfig::load(const std::vector<std::string>& args, const EnvLookup& env) {
    ServerConfig cfg;

    static const std::pair<const char*, const char*> kEnv[] = {
        {"HOST", "host"},
        {"PORT", "port"},
        {"RELAY_THREADS", "threads"},
        {"RELAY_PING_TIMEOUT", "ping-timeout"},
        {"RELAY_MAX_MESSAGE_MB", "max-message-mb"},
        {"RELAY_LOG_LEVEL", "log-level"},
    };
    if (env) {
        for (const auto& [var, option] : kEnv) {
            const char* v = env(var);
            if (v && *v) set_option(cfg, option, v);
        }
    }

    // --name value or --name=value
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            cfg.show_help = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) throw std::invalid_argument("unexpected argument '" + arg + "'");

        std::string name = arg.substr(2);
        std::string value;
        if (auto eq = name.find('='); eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.resize(eq);
        } else {
            if (i + 1 >= args.size()) throw std::invalid_argument("--" + name + ": missing value");
            value = args[++i];
        }
        set_option(cfg, name, value);
    }
    return cfg;
}

networking::WebSocketServer::Options ServerConfig::transport_options() const {
    networking::WebSocketServer::Options opts;
    opts.address = host;
    opts.port = port;
    opts.max_message_bytes = max_message_bytes;
    opts.idle_timeout = ping_timeout;
    return opts;
}

std::string usage(const std::string& program) {
    return "usage: " + program + " [options]\n"
           "  --host ADDR            listen address (HOST, default 0.0.0.0)\n"
           "  --port N               listen port (PORT, default 5000)\n"
           "  --threads N            io threads (RELAY_THREADS, default 1)\n"
           "  --ping-timeout SECS    drop silent peers after SECS (RELAY_PING_TIMEOUT, default 60)\n"
           "  --max-message-mb N     largest inbound message (RELAY_MAX_MESSAGE_MB, default 15)\n"
           "  --log-level LEVEL      debug|info|warn|error (RELAY_LOG_LEVEL, default info)\n"
           "  -h, --help             show this help\n";
}

} // namespace photorelay::config
