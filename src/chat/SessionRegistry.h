#pragma once

#include "chat/Session.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace textrelay::chat {

// Username -> live session. Every access takes mu_; nothing here does I/O.
class SessionRegistry {
public:
    struct Registration {
        std::string username;
        std::vector<std::string> already_online;   // members just before the insert
    };

    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Inserts under `candidate`, or `candidate1`, `candidate2`, ... if taken.
    // Throws std::invalid_argument for a blank candidate.
    std::string register_session(const std::string& candidate, std::shared_ptr<Peer> peer);

    // Same as register_session, plus the roster captured under the same lock.
    Registration register_with_roster(const std::string& candidate, std::shared_ptr<Peer> peer);

    // Idempotent. Returns false if `username` was not registered.
    bool unregister(const std::string& username);

    std::optional<Session> lookup(const std::string& username) const;
    bool contains(const std::string& username) const;

    // Point-in-time copy; deliver to it after this returns, never under the lock.
    std::vector<Session> snapshot() const;

    std::size_t size() const;

private:
    std::string free_name_locked(const std::string& candidate) const;

    mutable std::mutex mu_;
    std::unordered_map<std::string, Session> sessions_;
};

} // namespace textrelay::chat
