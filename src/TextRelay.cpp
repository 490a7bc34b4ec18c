#include "chat/Dispatcher.h"
#include "chat/SessionRegistry.h"
#include "config/ServerConfig.h"
#include "networking/RelayServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace textrelay;

    config::ServerConfig cfg;
    try {
        auto parsed = config::parse_command_line(argc, argv, std::cout);
        if (!parsed) return 0;
        cfg = *parsed;
    } catch (const config::ConfigError& ex) {
        std::cerr << "[TextRelay] " << ex.what() << "\n"
                  << "usage: textrelay-server [port] [--bind ADDR] [--threads N] [--max-line BYTES]\n";
        return 2;
    }

    boost::asio::io_context ioc(static_cast<int>(cfg.threads));

    chat::SessionRegistry registry;
    chat::Dispatcher dispatcher(registry);

    std::unique_ptr<networking::RelayServer> server;
    try {
        server = std::make_unique<networking::RelayServer>(ioc, cfg, registry, dispatcher);
    } catch (const boost::system::system_error& ex) {
        std::cerr << "[TextRelay] cannot listen on " << cfg.address << ":" << cfg.port
                  << ": " << ex.what() << "\n";
        return 1;
    }

    server->start();

    // Ctrl+C / SIGTERM stops accepting. Open connections are dropped when the
    // io_context stops; they get no leave broadcast.
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        std::cout << "\n[TextRelay] shutting down...\n";
        server->stop();
        ioc.stop();
    });

    std::cout << "[TextRelay] listening on " << cfg.address << ":" << server->port()
              << " (" << cfg.threads << " thread" << (cfg.threads == 1 ? "" : "s") << ")\n";

    std::vector<std::thread> workers;
    workers.reserve(cfg.threads - 1);
    for (std::size_t i = 1; i < cfg.threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();

    for (auto& t : workers) t.join();

    std::cout << "[TextRelay] exit.\n";
    return 0;
}
