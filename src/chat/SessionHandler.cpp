#include "chat/SessionHandler.h"

#include "chat/Username.h"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace textrelay::chat {

SessionHandler::SessionHandler(SessionRegistry& registry, Dispatcher& dispatcher, std::shared_ptr<Peer> peer)
    : registry_(registry),
      dispatcher_(dispatcher),
      peer_(std::move(peer)) {}

void SessionHandler::on_line(std::string_view line) {
    switch (state_) {
        case State::AwaitingJoin: handle_join(line); break;
        case State::Active:       handle_active(line); break;
        case State::Closed:       break;
    }
}

void SessionHandler::on_end() {
    close();
}

void SessionHandler::handle_join(std::string_view line) {
    auto join = decode(line);
    if (!join || join->kind != Kind::Join) {
        reject("Invalid join");
        return;
    }

    std::string candidate = trim_copy(std::move(join->from));
    if (candidate.empty()) {
        reject("Invalid join: missing username");
        return;
    }

    auto registration = registry_.register_with_roster(candidate, peer_);
    username_ = std::move(registration.username);
    joined_at_ = std::chrono::steady_clock::now();

    std::cout << "[Relay] " + username_ + " connected from " + peer_->label() + "\n";

    // Backlog: one synthetic join per user that was online before us.
    for (const auto& user : registration.already_online) {
        send_to_self(make_join(user, user + " (already online)"));
    }
    if (state_ == State::Closed) return;

    state_ = State::Active;
    dispatcher_.broadcast(make_join(username_, username_ + " joined"));
}

void SessionHandler::handle_active(std::string_view line) {
    auto env = decode(line);
    if (!env) return;

    env->from = username_;
    env->timestamp = unix_now();

    switch (env->kind) {
        case Kind::Msg:
        case Kind::Typing:
        case Kind::StopTyping:
            dispatcher_.broadcast(*env);
            break;
        case Kind::Pm:
            dispatcher_.send_directed(env->to.value_or(std::string()), *env);
            break;
        case Kind::Leave:
            close();
            break;
        case Kind::Join:
        case Kind::Sys:
            break;
    }
}

void SessionHandler::reject(const std::string& reason) {
    std::cerr << "[Relay] rejected " + peer_->label() + ": " + reason + "\n";
    send_to_self(make_sys(reason));
    close();
}

void SessionHandler::send_to_self(const Envelope& env) {
    if (!peer_) return;

    try {
        peer_->deliver(encode(env));
    } catch (const std::exception& ex) {
        std::cerr << "[Relay] write to " + peer_->label() + " failed: " + ex.what() + "\n";
        close();
    }
}

void SessionHandler::close() {
    if (state_ == State::Closed) return;
    state_ = State::Closed;

    if (!username_.empty()) {
        registry_.unregister(username_);

        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - joined_at_).count();
        std::cout << "[Relay] " + username_ + " disconnected after " + std::to_string(seconds) + "s\n";

        dispatcher_.broadcast(make_leave(username_));
    }

    if (!peer_) return;
    auto peer = std::move(peer_);
    try {
        peer->close();
    } catch (const std::exception& ex) {
        std::cerr << "[Relay] close " + peer->label() + ": " + ex.what() + "\n";
    }
}

} // namespace textrelay::chat
