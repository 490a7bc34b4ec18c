#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include "chat/Dispatcher.h"
#include "chat/Envelope.h"
#include "chat/SessionRegistry.h"
#include "config/ServerConfig.h"
#include "networking/RelayServer.h"
#include "common/test_check.hpp"

using namespace textrelay;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

// Blocking line client for the loopback tests.
class LineClient {
public:
    // A non-zero `receive_buffer` shrinks SO_RCVBUF before connecting.
    explicit LineClient(unsigned short port, int receive_buffer = 0) : socket_(ioc_) {
        if (receive_buffer > 0) {
            socket_.open(tcp::v4());
            socket_.set_option(asio::socket_base::receive_buffer_size(receive_buffer));
        }
        socket_.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    }

    void send(const std::string& line) {
        send_raw(line + "\n");
    }

    void send_raw(const std::string& bytes) {
        asio::write(socket_, asio::buffer(bytes));
    }

    // Next line decoded; empty on end of stream or on an undecodable line.
    std::optional<chat::Envelope> read() {
        boost::system::error_code ec;
        std::size_t n = asio::read_until(socket_, asio::dynamic_buffer(buffer_), '\n', ec);
        if (ec) return std::nullopt;

        std::string line = buffer_.substr(0, n - 1);
        buffer_.erase(0, n);
        return chat::decode(line);
    }

    bool reached_eof() {
        boost::system::error_code ec;
        asio::read_until(socket_, asio::dynamic_buffer(buffer_), '\n', ec);
        return ec == asio::error::eof || ec == asio::error::connection_reset;
    }

    void shutdown_send() {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_send, ec);
    }

    void close() {
        boost::system::error_code ec;
        socket_.close(ec);
    }

private:
    asio::io_context ioc_;
    tcp::socket socket_;
    std::string buffer_;
};

std::string join_line(const std::string& name) {
    return R"({"Type":"join","From":")" + name + R"(","Ts":1})";
}

// Server on an ephemeral loopback port, io_context run by two threads.
struct TestServer {
    explicit TestServer(config::ServerConfig cfg = {}) {
        cfg.address = "127.0.0.1";
        cfg.port = 0;
        server = std::make_unique<networking::RelayServer>(ioc, cfg, registry, dispatcher);
        server->start();
        for (int i = 0; i < 2; ++i) {
            workers.emplace_back([this] { ioc.run(); });
        }
    }

    ~TestServer() {
        server->stop();
        ioc.stop();
        for (auto& t : workers) t.join();
    }

    unsigned short port() const { return server->port(); }

    asio::io_context ioc;
    chat::SessionRegistry registry;
    chat::Dispatcher dispatcher{registry};
    std::unique_ptr<networking::RelayServer> server;
    std::vector<std::thread> workers;
};

} // namespace

// -----------------------------------------------------------------------------
// Test: join, duplicate name, broadcast, pm-not-found, abrupt disconnect
// -----------------------------------------------------------------------------
void test_chat_flow() {
    std::cout << "[TEST] RelayServer chat flow\n";

    TestServer ts;
    TEST_CHECK(ts.port() != 0);

    LineClient a(ts.port());
    a.send(join_line("alice"));
    auto a_join = a.read();
    TEST_CHECK(a_join && a_join->kind == chat::Kind::Join && a_join->from == "alice");

    LineClient b(ts.port());
    b.send(join_line("alice"));

    auto backlog = b.read();
    TEST_CHECK(backlog && backlog->kind == chat::Kind::Join && backlog->from == "alice");
    TEST_CHECK(backlog->text && *backlog->text == "alice (already online)");

    auto b_join = b.read();
    TEST_CHECK(b_join && b_join->kind == chat::Kind::Join && b_join->from == "alice1");

    auto a_sees_b = a.read();
    TEST_CHECK(a_sees_b && a_sees_b->kind == chat::Kind::Join && a_sees_b->from == "alice1");

    // Client-supplied From and Ts are replaced.
    a.send(R"({"Type":"msg","From":"mallory","Text":"hi","Ts":5})");
    for (auto* client : {&a, &b}) {
        auto msg = client->read();
        TEST_CHECK(msg && msg->kind == chat::Kind::Msg);
        TEST_CHECK(msg->from == "alice");
        TEST_CHECK(msg->text && *msg->text == "hi");
        TEST_CHECK(msg->timestamp > 5);
    }

    // Lines may end in \r\n.
    b.send_raw("{\"Type\":\"pm\",\"To\":\"alice\",\"Text\":\"psst\"}\r\n");
    auto pm = a.read();
    TEST_CHECK(pm && pm->kind == chat::Kind::Pm && pm->from == "alice1");
    TEST_CHECK(pm->text && *pm->text == "psst");

    a.send(R"({"Type":"pm","To":"carol","Text":"hey"})");
    auto not_found = a.read();
    TEST_CHECK(not_found && not_found->kind == chat::Kind::Sys);
    TEST_CHECK(not_found->text && *not_found->text == "User 'carol' not found");

    b.close();
    auto left = a.read();
    TEST_CHECK(left && left->kind == chat::Kind::Leave && left->from == "alice1");

    a.send(R"({"Type":"leave"})");
    TEST_CHECK(a.reached_eof());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a bad first line gets a sys notice, then the server closes
// -----------------------------------------------------------------------------
void test_handshake_rejected() {
    std::cout << "[TEST] RelayServer handshake rejected\n";

    TestServer ts;

    LineClient c(ts.port());
    c.send(R"({"Type":"msg","From":"carol","Text":"hi"})");

    auto sys = c.read();
    TEST_CHECK(sys && sys->kind == chat::Kind::Sys);
    TEST_CHECK(sys->text && *sys->text == "Invalid join");
    TEST_CHECK(c.reached_eof());
    TEST_CHECK(ts.registry.size() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a last line without '\n' is still routed before the leave
// -----------------------------------------------------------------------------
void test_unterminated_last_line() {
    std::cout << "[TEST] RelayServer unterminated last line\n";

    TestServer ts;

    LineClient a(ts.port());
    a.send(join_line("alice"));
    TEST_CHECK(a.read());

    LineClient b(ts.port());
    b.send(join_line("bob"));
    TEST_CHECK(b.read());   // backlog alice
    TEST_CHECK(b.read());   // own join
    TEST_CHECK(a.read());   // bob joined

    b.send_raw(R"({"Type":"msg","Text":"bye"})");
    b.shutdown_send();

    auto msg = a.read();
    TEST_CHECK(msg && msg->kind == chat::Kind::Msg && msg->from == "bob");
    auto left = a.read();
    TEST_CHECK(left && left->kind == chat::Kind::Leave && left->from == "bob");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: an oversized line drops the connection like any read failure
// -----------------------------------------------------------------------------
void test_oversized_line() {
    std::cout << "[TEST] RelayServer oversized line\n";

    config::ServerConfig cfg;
    cfg.max_line_bytes = config::ServerConfig::kMinMaxLineBytes;
    TestServer ts(cfg);

    LineClient a(ts.port());
    a.send(join_line("alice"));
    TEST_CHECK(a.read());

    LineClient d(ts.port());
    d.send(join_line("dave"));
    TEST_CHECK(d.read());   // backlog alice
    TEST_CHECK(d.read());   // own join
    TEST_CHECK(a.read());   // dave joined

    d.send(R"({"Type":"msg","Text":")" + std::string(1000, 'x') + R"("})");

    auto left = a.read();
    TEST_CHECK(left && left->kind == chat::Kind::Leave && left->from == "dave");
    TEST_CHECK(!ts.registry.contains("dave"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a client that stops reading is dropped once its queue is full
// -----------------------------------------------------------------------------
void test_slow_reader_dropped() {
    std::cout << "[TEST] RelayServer slow reader dropped\n";

    config::ServerConfig cfg;
    cfg.max_queued_bytes = config::ServerConfig::kMinMaxQueuedBytes;
    TestServer ts(cfg);

    LineClient a(ts.port());
    a.send(join_line("alice"));
    TEST_CHECK(a.read());

    // bob joins and never reads again.
    LineClient b(ts.port(), 4096);
    b.send(join_line("bob"));
    auto b_joined = a.read();
    TEST_CHECK(b_joined && b_joined->kind == chat::Kind::Join && b_joined->from == "bob");

    const std::string msg = R"({"Type":"msg","Text":")" + std::string(16 * 1024, 'x') + R"("})";

    // alice keeps reading her own echoes, so only bob falls behind.
    bool bob_left = false;
    for (int i = 0; i < 4000 && !bob_left; ++i) {
        a.send(msg);
        auto got = a.read();
        TEST_CHECK(got);
        bob_left = got->kind == chat::Kind::Leave && got->from == "bob";
    }

    TEST_CHECK(bob_left);
    TEST_CHECK(!ts.registry.contains("bob"));
    TEST_CHECK(ts.registry.contains("alice"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: stop() from another thread closes the listener, sessions keep working
// -----------------------------------------------------------------------------
void test_stop_while_accepting() {
    std::cout << "[TEST] RelayServer stop while accepting\n";

    TestServer ts;
    const unsigned short port = ts.port();

    LineClient a(port);
    a.send(join_line("alice"));
    TEST_CHECK(a.read());

    // Keep connections arriving while stop() is called.
    std::atomic<bool> dialing{true};
    std::thread dialer([&] {
        while (dialing) {
            try {
                LineClient c(port);
            } catch (const boost::system::system_error&) {
                // refused once the listener is gone
            }
        }
    });

    ts.server->stop();

    bool refused = false;
    for (int i = 0; i < 500 && !refused; ++i) {
        try {
            LineClient late(port);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        } catch (const boost::system::system_error&) {
            refused = true;
        }
    }

    dialing = false;
    dialer.join();
    TEST_CHECK(refused);

    a.send(R"({"Type":"msg","Text":"still here"})");
    auto msg = a.read();
    TEST_CHECK(msg && msg->kind == chat::Kind::Msg && msg->from == "alice");
    TEST_CHECK(msg->text && *msg->text == "still here");

    std::cout << "[TEST] OK\n";
}

int main() {
    test_chat_flow();
    test_handshake_rejected();
    test_unterminated_last_line();
    test_oversized_line();
    test_slow_reader_dropped();
    test_stop_while_accepting();

    std::cout << "[TEST] ALL RELAY SERVER TESTS PASSED\n";
    return 0;
}
