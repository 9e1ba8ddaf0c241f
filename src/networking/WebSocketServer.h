#pragma once

#include "networking/Connection.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace livestate::networking {

class WebSocketServer {
public:
    // Called once per connection after the handshake succeeds.
    using HandlerFactory = std::function<std::shared_ptr<ConnectionHandler>(std::shared_ptr<Connection>)>;

    struct Options {
        std::size_t max_message_bytes = 64 * 1024;
        std::chrono::milliseconds flush_timeout{3000};
    };

    WebSocketServer(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
                    Options options);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_handler_factory(HandlerFactory factory);

    void start();  // start accepting
    void stop();   // stop accepting + close active connections (ServerShutdown)

    unsigned short port() const;
    std::size_t connections() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace livestate::networking
