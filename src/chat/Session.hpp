#pragma once

#include "chat/Peer.hpp"

#include <memory>
#include <string>

namespace textrelay::chat {

struct Session {
    std::string username;
    std::shared_ptr<Peer> peer;   // owned by the SessionHandler, borrowed here
};

} // namespace textrelay::chat
