#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace textrelay::config {

struct ServerConfig {
    static constexpr unsigned short kDefaultPort = 5000;
    static constexpr std::size_t kDefaultMaxLineBytes = 64 * 1024;
    static constexpr std::size_t kMinMaxLineBytes = 256;
    static constexpr std::size_t kDefaultMaxQueuedBytes = 4 * 1024 * 1024;
    static constexpr std::size_t kMinMaxQueuedBytes = 64 * 1024;

    std::string address = "0.0.0.0";
    unsigned short port = kDefaultPort;
    std::size_t threads = 1;
    std::size_t max_line_bytes = kDefaultMaxLineBytes;
    // Outbound bytes a connection may have pending before it is dropped.
    std::size_t max_queued_bytes = kDefaultMaxQueuedBytes;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parses `textrelay-server [port] [--bind ADDR] [--threads N] [--max-line BYTES]
// [--max-queue BYTES]`.
// Returns std::nullopt when --help was given (usage already written to `out`).
// Throws ConfigError on anything invalid.
std::optional<ServerConfig> parse_command_line(int argc, const char* const argv[], std::ostream& out);

} // namespace textrelay::config
