#include "chat/Dispatcher.h"

#include "chat/Username.h"

#include <exception>
#include <iostream>

namespace textrelay::chat {

// Failed deliveries are routine (the peer is usually already gone), so they
// are only reported in debug builds.
static constexpr bool DEBUG_MODE = false;

std::size_t Dispatcher::broadcast(const Envelope& env) {
    const std::string line = encode(env);

    std::size_t delivered = 0;
    for (const Session& session : registry_.snapshot()) {
        if (try_deliver(session, line)) ++delivered;
    }
    return delivered;
}

bool Dispatcher::send_directed(const std::string& to, const Envelope& env) {
    if (is_blank(to)) return false;

    if (auto target = registry_.lookup(to)) {
        return try_deliver(*target, encode(env));
    }

    auto sender = registry_.lookup(env.from);
    if (!sender) return false;

    try_deliver(*sender, encode(make_sys("User '" + to + "' not found")));
    return false;
}

bool Dispatcher::try_deliver(const Session& session, const std::string& line) {
    if (!session.peer) return false;

    try {
        session.peer->deliver(line);
        return true;
    } catch (const std::exception& ex) {
        if constexpr (DEBUG_MODE) {
            std::cerr << "[Dispatcher] deliver to " + session.username + " failed: " + ex.what() + "\n";
        }
        return false;
    }
}

} // namespace textrelay::chat
