#include "networking/RelayServer.h"

#include "chat/Peer.hpp"
#include "chat/SessionHandler.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>

#include <deque>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace textrelay::networking {

namespace beast = boost::beast;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

std::string endpoint_label(const tcp::socket& socket) {
    beast::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

class RelayServer::Impl {
public:
    Impl(asio::io_context& ioc,
         const config::ServerConfig& config,
         chat::SessionRegistry& registry,
         chat::Dispatcher& dispatcher)
        : ioc_(ioc),
          config_(config),
          registry_(registry),
          dispatcher_(dispatcher),
          accept_strand_(asio::make_strand(ioc)),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(config.address), config.port)),
          port_(acceptor_.local_endpoint().port()) {}

    // The acceptor is only touched on accept_strand_, whichever thread
    // calls start() or stop().
    void start() {
        asio::post(accept_strand_, [this] { do_accept(); });
    }

    void stop() {
        asio::post(accept_strand_, [this] {
            beast::error_code ec;
            acceptor_.close(ec);
        });
    }

    unsigned short port() const { return port_; }

private:
    // One accepted socket. Reads, handler transitions and writes all run on
    // strand_, so the SessionHandler never sees concurrent calls.
    class Connection : public chat::Peer, public std::enable_shared_from_this<Connection> {
    public:
        Connection(Impl& server, tcp::socket socket)
            : server_(server),
              label_(endpoint_label(socket)),
              stream_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        void start() {
            handler_ = std::make_unique<chat::SessionHandler>(
                server_.registry_, server_.dispatcher_, shared_from_this());

            asio::post(strand_, [self = shared_from_this()] { self->do_read(); });
        }

        void deliver(std::string line) override {
            line.push_back('\n');
            asio::post(
                strand_,
                [self = shared_from_this(), msg = std::move(line)]() mutable {
                    if (self->write_failed_ || self->closed_) return;

                    bool writing = !self->write_queue_.empty();
                    if (writing && self->queued_bytes_ + msg.size() > self->server_.config_.max_queued_bytes) {
                        self->overflow();
                        return;
                    }

                    self->queued_bytes_ += msg.size();
                    self->write_queue_.push_back(std::move(msg));
                    if (!writing) self->do_write();
                });
        }

        void close() override {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    self->closing_ = true;
                    if (self->write_queue_.empty()) self->do_close();
                });
        }

        std::string label() const override { return label_; }

    private:
        void do_read() {
            asio::async_read_until(
                stream_,
                asio::dynamic_buffer(read_buffer_, server_.config_.max_line_bytes),
                '\n',
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t n) {
                        self->on_read(ec, n);
                    }));
        }

        void on_read(beast::error_code ec, std::size_t n) {
            if (ec) {
                if (ec == asio::error::eof) {
                    // A final line without '\n' still counts.
                    if (!read_buffer_.empty()) {
                        std::string last = std::move(read_buffer_);
                        read_buffer_.clear();
                        feed(last);
                    }
                } else if (ec == asio::error::not_found) {
                    fail("read", "line exceeds " + std::to_string(server_.config_.max_line_bytes) + " bytes");
                } else if (ec != asio::error::operation_aborted) {
                    fail("read", ec.message());
                }
                handler_->on_end();
                return;
            }

            std::string line = read_buffer_.substr(0, n - 1);
            read_buffer_.erase(0, n);

            feed(line);

            if (!handler_->closed()) do_read();
        }

        void feed(const std::string& line) {
            try {
                handler_->on_line(strip_cr(line));
            } catch (const std::exception& ex) {
                // Anything unexpected is an ordinary disconnect for this peer only.
                fail("handler", ex.what());
                handler_->on_end();
            }
        }

        void do_write() {
            asio::async_write(
                stream_,
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        self->on_write(ec);
                    }));
        }

        void on_write(beast::error_code ec) {
            if (ec) {
                // Stop writing; the read side notices the dead peer on its own.
                fail("write", ec.message());
                write_failed_ = true;
                write_queue_.clear();
                queued_bytes_ = 0;
                if (closing_) do_close();
                return;
            }

            queued_bytes_ -= write_queue_.front().size();
            write_queue_.pop_front();
            if (write_failed_) {
                write_queue_.clear();
                queued_bytes_ = 0;
                return;
            }
            if (!write_queue_.empty()) {
                do_write();
            } else if (closing_) {
                do_close();
            }
        }

        // The peer is not reading fast enough. Treated as a write failure,
        // except the socket is closed so the read side ends the session.
        void overflow() {
            fail("write", "more than " + std::to_string(server_.config_.max_queued_bytes) + " bytes unsent");
            write_failed_ = true;

            // The front buffer belongs to the async_write in flight.
            write_queue_.erase(write_queue_.begin() + 1, write_queue_.end());
            queued_bytes_ = write_queue_.front().size();

            do_close();
        }

        void do_close() {
            if (closed_) return;
            closed_ = true;

            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
            stream_.close();
        }

        void fail(const char* what, const std::string& message) {
            std::cerr << "[Connection " + label_ + "] " + what + ": " + message + "\n";
        }

        static std::string_view strip_cr(const std::string& line) {
            std::string_view view(line);
            if (!view.empty() && view.back() == '\r') view.remove_suffix(1);
            return view;
        }

        Impl& server_;
        std::string label_;

        beast::tcp_stream stream_;
        // Use the io_context executor type for compatibility with older Boost.Asio.
        asio::strand<asio::io_context::executor_type> strand_;

        std::unique_ptr<chat::SessionHandler> handler_;

        std::string read_buffer_;
        std::deque<std::string> write_queue_;
        std::size_t queued_bytes_ = 0;
        bool write_failed_ = false;
        bool closing_ = false;
        bool closed_ = false;
    };

    void do_accept() {
        acceptor_.async_accept(
            asio::bind_executor(
                accept_strand_,
                [this](beast::error_code ec, tcp::socket socket) {
                    if (ec) {
                        // If acceptor closed during shutdown, ignore.
                        if (ec == asio::error::operation_aborted || !acceptor_.is_open()) return;
                        std::cerr << "[accept] " + ec.message() + "\n";
                        return do_accept();
                    }

                    std::make_shared<Connection>(*this, std::move(socket))->start();
                    do_accept();
                }));
    }

    asio::io_context& ioc_;
    config::ServerConfig config_;
    chat::SessionRegistry& registry_;
    chat::Dispatcher& dispatcher_;
    asio::strand<asio::io_context::executor_type> accept_strand_;
    tcp::acceptor acceptor_;
    unsigned short port_;
};

// ---- RelayServer wrapper ----

RelayServer::RelayServer(asio::io_context& ioc,
                         const config::ServerConfig& config,
                         chat::SessionRegistry& registry,
                         chat::Dispatcher& dispatcher)
    : impl_(new Impl(ioc, config, registry, dispatcher)) {}

RelayServer::~RelayServer() = default;

void RelayServer::start() { impl_->start(); }
void RelayServer::stop() { impl_->stop(); }

unsigned short RelayServer::port() const { return impl_->port(); }

} // namespace textrelay::networking
