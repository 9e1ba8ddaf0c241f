#include "networking/WebSocketServer.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <iterator>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace livestate::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

const char* to_string(CloseReason reason) noexcept {
    switch (reason) {
        case CloseReason::Normal:                 return "Normal";
        case CloseReason::IdleTimeout:            return "IdleTimeout";
        case CloseReason::SubscriberDisconnected: return "SubscriberDisconnected";
        case CloseReason::ProtocolViolation:      return "ProtocolViolation";
        case CloseReason::HandshakeFailure:       return "HandshakeFailure";
        case CloseReason::TransportFailure:       return "TransportFailure";
        case CloseReason::ServerShutdown:         return "ServerShutdown";
    }
    return "Unknown";
}

namespace {

websocket::close_code close_code_for(CloseReason reason) {
    switch (reason) {
        case CloseReason::ProtocolViolation:      return websocket::close_code::policy_error;
        case CloseReason::SubscriberDisconnected: return websocket::close_code::try_again_later;
        case CloseReason::ServerShutdown:         return websocket::close_code::going_away;
        default:                                  return websocket::close_code::normal;
    }
}

} // namespace

class WebSocketServer::Impl {
    class Session;

    // Shared with every session: a session that outlives the server (its
    // handler still queued on the io_context) keeps the registry alive.
    struct State {
        explicit State(Options o) : options(o) {}

        void remove(ClientId id) {
            std::lock_guard<std::mutex> lk(mu);
            sessions.erase(id);
        }

        Options options;
        HandlerFactory factory;

        mutable std::mutex mu;
        std::unordered_map<ClientId, std::shared_ptr<Session>> sessions;
    };

public:
    Impl(asio::io_context& ioc, const tcp::endpoint& endpoint, Options options)
        : ioc_(ioc),
          acceptor_(ioc, endpoint),
          state_(std::make_shared<State>(options)) {}

    ~Impl() {
        // Sessions hold the state; drop the registry's references to them.
        std::unordered_map<ClientId, std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lk(state_->mu);
            sessions.swap(state_->sessions);
        }
    }

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        std::vector<std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lk(state_->mu);
            for (auto& [id, s] : state_->sessions) sessions.push_back(s);
        }
        for (auto& s : sessions) {
            s->dispatch([s] { s->close(CloseReason::ServerShutdown); });
        }
    }

    void set_handler_factory(HandlerFactory factory) { state_->factory = std::move(factory); }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    std::size_t connections() const {
        std::lock_guard<std::mutex> lk(state_->mu);
        return state_->sessions.size();
    }

private:
    class Session : public Connection, public std::enable_shared_from_this<Session> {
    public:
        Session(std::shared_ptr<State> state, asio::io_context& ioc, tcp::socket socket, ClientId id)
            : state_(std::move(state)),
              id_(id),
              ws_(std::move(socket)),
              strand_(asio::make_strand(ioc)),
              flush_timer_(ioc) {}

        ClientId id() const noexcept override { return id_; }

        void start() {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.read_message_max(state_->options.max_message_bytes);

            ws_.async_accept(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) {
                            self->fail("accept", ec);
                            return self->finish(CloseReason::HandshakeFailure);
                        }

                        if (self->state_->factory) self->handler_ = self->state_->factory(self);
                        if (!self->handler_) {
                            self->close(CloseReason::ServerShutdown);
                            return self->do_read();
                        }

                        self->handler_->on_open();
                        self->do_read();
                    }));
        }

        void send(std::string frame, std::string tag) override {
            if (closing_ || finished_) return;
            bool writing = !write_queue_.empty();
            write_queue_.push_back(Frame{std::move(frame), std::move(tag)});
            if (!writing) do_write();
        }

        std::size_t discard(const std::string& tag) override {
            if (tag.empty() || write_queue_.empty()) return 0;
            // The front frame may already be on the wire.
            auto first = std::next(write_queue_.begin());
            auto last = std::remove_if(first, write_queue_.end(),
                                       [&](const Frame& f) { return f.tag == tag; });
            std::size_t n = static_cast<std::size_t>(std::distance(last, write_queue_.end()));
            write_queue_.erase(last, write_queue_.end());
            return n;
        }

        std::size_t queued() const noexcept override { return write_queue_.size(); }

        void close(CloseReason reason) override {
            if (closing_ || finished_) return;
            closing_ = true;
            close_reason_ = reason;

            flush_timer_.expires_after(state_->options.flush_timeout);
            flush_timer_.async_wait(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec == asio::error::operation_aborted) return;
                        if (!self->finished_) {
                            spdlog::debug("[Session {}] flush timed out, dropping {} frame(s)",
                                          self->id_, self->write_queue_.size());
                            self->abort();
                        }
                    }));

            if (write_queue_.empty()) do_close();
        }

        void dispatch(std::function<void()> fn) override {
            asio::dispatch(strand_, [self = shared_from_this(), fn = std::move(fn)] { fn(); });
        }

    private:
        struct Frame {
            std::string text;
            std::string tag;
        };

        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        if (!self->closing_ && self->handler_) self->handler_->on_message(msg);

                        self->do_read();
                    }));
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front().text),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) {
                            self->fail("write", ec);
                            self->write_queue_.clear();
                            return self->abort();
                        }

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) return self->do_write();

                        if (self->closing_) return self->do_close();
                        if (self->handler_) self->handler_->on_drained();
                    }));
        }

        void do_close() {
            if (close_sent_) return;
            close_sent_ = true;
            ws_.async_close(
                websocket::close_reason(close_code_for(close_reason_), to_string(close_reason_)),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) self->abort();
                        // Otherwise the pending read completes with error::closed.
                    }));
        }

        // Tears down the socket; the pending read fails and finishes the session.
        void abort() {
            if (!closing_) {
                closing_ = true;
                close_reason_ = CloseReason::TransportFailure;
            }
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
        }

        void on_close_or_fail(beast::error_code ec) {
            // WebSocket close is common; treat it as disconnect.
            if (ec == websocket::error::closed) {
                return finish(closing_ ? close_reason_ : CloseReason::Normal);
            }
            if (ec != asio::error::operation_aborted) fail("read", ec);
            finish(closing_ ? close_reason_ : CloseReason::TransportFailure);
        }

        void finish(CloseReason reason) {
            if (finished_) return;
            finished_ = true;
            closing_ = true;
            flush_timer_.cancel();
            write_queue_.clear();

            state_->remove(id_);
            if (handler_) {
                auto handler = std::move(handler_);
                handler->on_closed(reason);
            }
        }

        void fail(const char* what, beast::error_code ec) {
            spdlog::debug("[Session {}] {}: {}", id_, what, ec.message());
        }

        std::shared_ptr<State> state_;
        ClientId id_;

        websocket::stream<beast::tcp_stream> ws_;
        // Use the io_context executor type for compatibility with older Boost.Asio.
        asio::strand<asio::io_context::executor_type> strand_;
        asio::steady_timer flush_timer_;

        beast::flat_buffer buffer_;
        std::deque<Frame> write_queue_;

        std::shared_ptr<ConnectionHandler> handler_;
        bool closing_ = false;
        bool close_sent_ = false;
        bool finished_ = false;
        CloseReason close_reason_ = CloseReason::Normal;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    spdlog::warn("[WebSocketServer] accept: {}", ec.message());
                    return do_accept();
                }

                auto id = next_client_id_++;
                auto session = std::make_shared<Session>(state_, ioc_, std::move(socket), id);

                {
                    std::lock_guard<std::mutex> lk(state_->mu);
                    state_->sessions[id] = session;
                }

                session->start();
                do_accept();
            });
    }

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<State> state_;

    std::atomic<ClientId> next_client_id_{1};
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, const tcp::endpoint& endpoint, Options options)
    : impl_(new Impl(ioc, endpoint, options)) {}

void WebSocketServer::set_handler_factory(HandlerFactory factory) { impl_->set_handler_factory(std::move(factory)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

unsigned short WebSocketServer::port() const { return impl_->port(); }
std::size_t WebSocketServer::connections() const { return impl_->connections(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace livestate::networking
