#include "networking/HttpServer.h"

#include "util/IDGenerator.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace livestate::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

HttpResponse plain_error(http::status status, unsigned version, const char* message) {
    HttpResponse res{status, version};
    res.set(http::field::server, "livestate");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = std::string("{\"error\":\"") + message + "\"}";
    res.prepare_payload();
    return res;
}

} // namespace

class HttpServer::Impl {
    class Session;

    // What sessions need from the server. Shared with every session, so a
    // session destroyed after the server (a handler still queued on the
    // io_context) finds its registry alive.
    struct State {
        State(asio::thread_pool& w, Options o) : workers(w), options(o) {}

        void remove(std::uint64_t id) {
            std::lock_guard<std::mutex> lk(mu);
            sessions.erase(id);
        }

        asio::thread_pool& workers;
        Options options;
        Handler handler;
        util::IDGenerator ids;

        std::mutex mu;
        std::unordered_map<std::uint64_t, std::weak_ptr<Session>> sessions;
    };

public:
    Impl(asio::io_context& ioc, asio::thread_pool& workers, const tcp::endpoint& endpoint, Options options)
        : ioc_(ioc),
          acceptor_(ioc, endpoint),
          state_(std::make_shared<State>(workers, options)) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        std::vector<std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lk(state_->mu);
            for (auto& [id, weak] : state_->sessions) {
                if (auto s = weak.lock()) sessions.push_back(std::move(s));
            }
        }
        for (auto& s : sessions) s->close();
    }

    void set_handler(Handler handler) { state_->handler = std::move(handler); }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

private:
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(std::shared_ptr<State> state, asio::io_context& ioc, tcp::socket socket, std::uint64_t id)
            : state_(std::move(state)),
              id_(id),
              stream_(std::move(socket)),
              strand_(asio::make_strand(ioc)) {}

        ~Session() { state_->remove(id_); }

        void start() {
            asio::post(strand_, [self = shared_from_this()] { self->do_read(); });
        }

        void close() {
            asio::post(strand_, [self = shared_from_this()] { self->do_shutdown(); });
        }

    private:
        void do_read() {
            parser_.emplace();
            parser_->body_limit(state_->options.max_body_bytes);
            stream_.expires_after(state_->options.read_timeout);

            http::async_read(
                stream_, buffer_, *parser_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        self->on_read(ec);
                    }));
        }

        void on_read(beast::error_code ec) {
            if (ec == http::error::end_of_stream) return do_shutdown();
            if (ec == http::error::body_limit) {
                return do_write(plain_error(http::status::payload_too_large, 11, "payload_too_large"));
            }
            if (ec) {
                if (ec != beast::error::timeout && ec != asio::error::operation_aborted) {
                    spdlog::debug("[HttpServer] read: {}", ec.message());
                }
                return do_shutdown();
            }

            HttpRequest req = parser_->release();
            stream_.expires_never();

            asio::post(state_->workers, [self = shared_from_this(), req = std::move(req)]() mutable {
                HttpResponse res = self->invoke(req);
                asio::post(self->strand_, [self, res = std::move(res)]() mutable {
                    self->do_write(std::move(res));
                });
            });
        }

        HttpResponse invoke(const HttpRequest& req) {
            if (!state_->handler) {
                return plain_error(http::status::service_unavailable, req.version(), "no_handler");
            }
            const std::string request_id = state_->ids.requestID();
            try {
                HttpResponse res = state_->handler(req);
                res.keep_alive(res.keep_alive() && req.keep_alive());
                res.set("X-Request-Id", request_id);
                spdlog::debug("[HttpServer] {} {} {} -> {}", request_id,
                              std::string(req.method_string().data(), req.method_string().size()),
                              std::string(req.target().data(), req.target().size()),
                              res.result_int());
                return res;
            } catch (const std::exception& e) {
                spdlog::error("[HttpServer] {} handler for {} threw: {}", request_id,
                              std::string(req.target().data(), req.target().size()), e.what());
                return plain_error(http::status::internal_server_error, req.version(), "internal");
            }
        }

        void do_write(HttpResponse res) {
            res_ = std::make_shared<HttpResponse>(std::move(res));
            stream_.expires_after(state_->options.read_timeout);

            http::async_write(
                stream_, *res_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        bool keep_alive = self->res_->keep_alive();
                        self->res_.reset();
                        if (ec) {
                            spdlog::debug("[HttpServer] write: {}", ec.message());
                            return self->do_shutdown();
                        }
                        if (!keep_alive) return self->do_shutdown();
                        self->do_read();
                    }));
        }

        void do_shutdown() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            stream_.close();
        }

        std::shared_ptr<State> state_;
        std::uint64_t id_;

        beast::tcp_stream stream_;
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        std::shared_ptr<HttpResponse> res_;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    if (ec == asio::error::operation_aborted) return;
                    spdlog::warn("[HttpServer] accept: {}", ec.message());
                    return do_accept();
                }

                auto id = next_id_++;
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

    std::atomic<std::uint64_t> next_id_{1};
};

HttpServer::HttpServer(asio::io_context& ioc, asio::thread_pool& workers, const tcp::endpoint& endpoint,
                       Options options)
    : impl_(new Impl(ioc, workers, endpoint, options)) {}

HttpServer::~HttpServer() = default;

void HttpServer::set_handler(Handler handler) { impl_->set_handler(std::move(handler)); }

void HttpServer::start() { impl_->start(); }
void HttpServer::stop() { impl_->stop(); }

unsigned short HttpServer::port() const { return impl_->port(); }

} // namespace livestate::networking
