#include "config/ServerConfig.h"

#include <boost/program_options.hpp>

#include <cctype>
#include <limits>

namespace textrelay::config {

namespace po = boost::program_options;

namespace {

unsigned short parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        throw ConfigError("invalid port '" + text + "'");
    }
    unsigned long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigError("invalid port '" + text + "'");
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value > std::numeric_limits<unsigned short>::max()) {
        throw ConfigError("port out of range: " + text);
    }
    return static_cast<unsigned short>(value);
}

} // namespace

std::optional<ServerConfig> parse_command_line(int argc, const char* const argv[], std::ostream& out) {
    ServerConfig cfg;

    int threads = static_cast<int>(cfg.threads);
    long long max_line = static_cast<long long>(cfg.max_line_bytes);
    long long max_queue = static_cast<long long>(cfg.max_queued_bytes);

    po::options_description desc("Usage: textrelay-server [port] [options]\nOptions");
    desc.add_options()
        ("help,h", "show this help and exit")
        ("port", po::value<std::string>(), "TCP port to listen on (default 5000)")
        ("bind", po::value<std::string>(&cfg.address)->default_value(cfg.address), "address to listen on")
        ("threads", po::value<int>(&threads)->default_value(threads), "io worker threads")
        ("max-line", po::value<long long>(&max_line)->default_value(max_line),
         "longest accepted line in bytes; longer lines drop the connection")
        ("max-queue", po::value<long long>(&max_queue)->default_value(max_queue),
         "unsent bytes allowed per connection; a slower reader is dropped");

    po::positional_options_description positional;
    positional.add("port", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& ex) {
        throw ConfigError(ex.what());
    }

    if (vm.count("help")) {
        out << desc << "\n";
        return std::nullopt;
    }

    if (vm.count("port")) {
        cfg.port = parse_port(vm["port"].as<std::string>());
    }
    if (threads < 1) {
        throw ConfigError("--threads must be at least 1");
    }
    if (max_line < static_cast<long long>(ServerConfig::kMinMaxLineBytes)) {
        throw ConfigError("--max-line must be at least " + std::to_string(ServerConfig::kMinMaxLineBytes));
    }
    if (max_queue < static_cast<long long>(ServerConfig::kMinMaxQueuedBytes)) {
        throw ConfigError("--max-queue must be at least " + std::to_string(ServerConfig::kMinMaxQueuedBytes));
    }
    if (cfg.address.empty()) {
        throw ConfigError("--bind must not be empty");
    }

    cfg.threads = static_cast<std::size_t>(threads);
    cfg.max_line_bytes = static_cast<std::size_t>(max_line);
    cfg.max_queued_bytes = static_cast<std::size_t>(max_queue);
    return cfg;
}

} // namespace textrelay::config
