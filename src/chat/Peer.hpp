#pragma once

#include <string>

namespace textrelay::chat {

// Write side of one connection, as seen by the registry and the dispatcher.
class Peer {
public:
    virtual ~Peer() = default;

    // Queue one encoded envelope (without the trailing newline).
    // May throw; callers treat a throw as a failed delivery.
    virtual void deliver(std::string line) = 0;

    // Flush what is queued, then release the transport.
    // Only the owning SessionHandler calls this.
    virtual void close() = 0;

    // Human-readable endpoint for log lines.
    virtual std::string label() const = 0;
};

} // namespace textrelay::chat
