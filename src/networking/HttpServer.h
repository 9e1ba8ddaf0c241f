#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace livestate::networking {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// HTTP/1.1 keep-alive server. The request handler may block: it runs on the
// worker pool, never on the I/O threads.
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    struct Options {
        std::size_t max_body_bytes = 1024 * 1024;
        std::chrono::seconds read_timeout{30};
    };

    HttpServer(boost::asio::io_context& ioc, boost::asio::thread_pool& workers,
               const boost::asio::ip::tcp::endpoint& endpoint, Options options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void set_handler(Handler handler);

    void start();
    void stop();

    unsigned short port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace livestate::networking
