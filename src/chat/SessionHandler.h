#pragma once

#include "chat/Dispatcher.h"
#include "chat/Envelope.h"
#include "chat/Peer.hpp"
#include "chat/SessionRegistry.h"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace textrelay::chat {

// Protocol state of one connection: AwaitingJoin -> Active -> Closed.
//
// The transport feeds it one line at a time and reports end-of-stream. It
// never touches sockets itself; it talks to its own connection only through
// `peer_`, and releases that peer exactly once when it reaches Closed.
// Calls for one handler must be serialized (the transport's strand does it).
class SessionHandler {
public:
    enum class State { AwaitingJoin, Active, Closed };

    SessionHandler(SessionRegistry& registry, Dispatcher& dispatcher, std::shared_ptr<Peer> peer);

    SessionHandler(const SessionHandler&) = delete;
    SessionHandler& operator=(const SessionHandler&) = delete;

    void on_line(std::string_view line);

    // End of stream or read failure.
    void on_end();

    State state() const noexcept { return state_; }
    bool closed() const noexcept { return state_ == State::Closed; }

    // Empty until the join handshake succeeded.
    const std::string& username() const noexcept { return username_; }

private:
    void handle_join(std::string_view line);
    void handle_active(std::string_view line);
    void reject(const std::string& reason);
    void send_to_self(const Envelope& env);
    void close();

    SessionRegistry& registry_;
    Dispatcher& dispatcher_;
    std::shared_ptr<Peer> peer_;

    State state_ = State::AwaitingJoin;
    std::string username_;
    // Set on a successful join; only used for the disconnect log.
    std::chrono::steady_clock::time_point joined_at_{};
};

} // namespace textrelay::chat
