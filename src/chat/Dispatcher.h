#pragma once

#include "chat/Envelope.h"
#include "chat/SessionRegistry.h"

#include <cstddef>
#include <string>

namespace textrelay::chat {

// Best-effort routing over the registry's current membership.
// A failed delivery is logged and skipped; the dead connection's own read
// loop is what eventually removes it from the registry.
class Dispatcher {
public:
    explicit Dispatcher(SessionRegistry& registry) : registry_(registry) {}

    // Returns how many deliveries did not throw.
    std::size_t broadcast(const Envelope& env);

    // Delivers to `to` only. If `to` is not registered, the sender (env.from)
    // gets a sys "not found" notice instead. Returns true if `to` got it.
    bool send_directed(const std::string& to, const Envelope& env);

private:
    static bool try_deliver(const Session& session, const std::string& line);

    SessionRegistry& registry_;
};

} // namespace textrelay::chat
