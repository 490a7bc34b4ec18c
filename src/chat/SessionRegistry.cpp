#include "chat/SessionRegistry.h"

#include "chat/Username.h"

#include <stdexcept>
#include <utility>

namespace textrelay::chat {

std::string SessionRegistry::register_session(const std::string& candidate, std::shared_ptr<Peer> peer) {
    return register_with_roster(candidate, std::move(peer)).username;
}

SessionRegistry::Registration SessionRegistry::register_with_roster(const std::string& candidate,
                                                                   std::shared_ptr<Peer> peer) {
    if (is_blank(candidate)) {
        throw std::invalid_argument("username must not be blank");
    }

    Registration result;

    std::lock_guard<std::mutex> lk(mu_);

    result.already_online.reserve(sessions_.size());
    for (const auto& [name, session] : sessions_) {
        result.already_online.push_back(name);
    }

    result.username = free_name_locked(candidate);

    Session session;
    session.username = result.username;
    session.peer = std::move(peer);
    sessions_.emplace(result.username, std::move(session));

    return result;
}

bool SessionRegistry::unregister(const std::string& username) {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.erase(username) > 0;
}

std::optional<Session> SessionRegistry::lookup(const std::string& username) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(username);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

bool SessionRegistry::contains(const std::string& username) const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.count(username) > 0;
}

std::vector<Session> SessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);

    std::vector<Session> out;
    out.reserve(sessions_.size());
    for (const auto& [name, session] : sessions_) {
        out.push_back(session);
    }
    return out;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

std::string SessionRegistry::free_name_locked(const std::string& candidate) const {
    if (sessions_.count(candidate) == 0) return candidate;

    for (unsigned long suffix = 1;; ++suffix) {
        std::string name = candidate + std::to_string(suffix);
        if (sessions_.count(name) == 0) return name;
    }
}

} // namespace textrelay::chat
