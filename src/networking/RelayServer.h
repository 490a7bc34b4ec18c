#pragma once

#include "chat/Dispatcher.h"
#include "chat/SessionRegistry.h"
#include "config/ServerConfig.h"

#include <boost/asio/io_context.hpp>

#include <memory>

namespace textrelay::networking {

// Accepts TCP connections and runs one line-framed connection per socket.
// Each connection drives its own chat::SessionHandler on a private strand.
class RelayServer {
public:
    // Binds immediately; throws boost::system::system_error if the address
    // cannot be bound.
    RelayServer(boost::asio::io_context& ioc,
                const config::ServerConfig& config,
                chat::SessionRegistry& registry,
                chat::Dispatcher& dispatcher);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    // Both may be called from any thread; the acceptor is serialized on its
    // own strand, so stop() takes effect once the io_context runs it.
    void start();  // start accepting
    void stop();   // stop accepting; open connections are left alone

    // Actual bound port (differs from the configured one when that was 0).
    unsigned short port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace textrelay::networking
