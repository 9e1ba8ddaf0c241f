#include "api/ResourceHandler.h"
#include "config/Config.h"
#include "log/Log.h"
#include "networking/HttpServer.h"
#include "networking/WebSocketServer.h"
#include "notify/ChangeFeed.h"
#include "notify/ChangeNotifier.h"
#include "realtime/SocketService.h"
#include "store/CouchStore.h"
#include "store/MemoryStore.h"
#include "store/StoreGateway.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using namespace livestate;

static std::unique_ptr<store::DocumentStore> make_store(const config::Config& cfg) {
    if (cfg.store == config::StoreBackend::Memory) {
        if (cfg.mode != config::Mode::All) {
            spdlog::warn("[LiveState] in-memory store in {} mode: state is not shared with the other service",
                         config::to_string(cfg.mode));
        }
        return std::make_unique<store::MemoryStore>();
    }

    store::CouchOptions opts;
    opts.host = cfg.store_host;
    opts.port = std::to_string(cfg.store_port);
    opts.database = cfg.store_db;
    opts.user = cfg.store_user;
    opts.password = cfg.store_password;
    opts.timeout = cfg.store_timeout;
    opts.pool_size = cfg.store_pool;

    auto couch = std::make_unique<store::CouchStore>(opts);

    // The store may still be starting; requests fail with 503 until it is up.
    boost::system::error_code ec;
    couch->ensure_database(ec);
    if (ec) {
        spdlog::warn("[LiveState] store {}:{} not ready ({}); continuing degraded",
                     cfg.store_host, cfg.store_port, ec.message());
    }
    return couch;
}

int main(int argc, char** argv) {
    auto parsed = config::parse(argc, argv, std::cout, std::cerr);
    if (!parsed.ok) return parsed.exit_code;
    const config::Config& cfg = parsed.config;

    log::init(cfg.log_level);
    {
        std::ostringstream os;
        cfg.dump(os);
        spdlog::info("[LiveState] starting: {}", os.str());
    }

    auto backend = make_store(cfg);

    store::RetryPolicy retry;
    retry.attempts = cfg.retry_attempts;
    retry.base_delay = cfg.retry_base;
    retry.max_delay = cfg.retry_max;
    store::StoreGateway gateway(*backend, retry);

    notify::NotifierOptions notifier_opts;
    notifier_opts.subscriber_buffer = cfg.subscriber_buffer;
    notifier_opts.reorder_window = cfg.reorder_window;
    notify::ChangeNotifier notifier(notifier_opts);

    // Declared after the notifier: handlers still queued at exit own
    // sessions that unsubscribe from it when destroyed.
    asio::io_context ioc;
    // Blocking store calls (HTTP handlers, snapshots) run here.
    asio::thread_pool workers(std::max(2u, cfg.threads));

    std::unique_ptr<notify::ChangeFeed> feed;
    std::unique_ptr<realtime::SocketService> socket_service;
    std::unique_ptr<networking::WebSocketServer> ws_server;
    std::unique_ptr<networking::HttpServer> http_server;

    try {
        if (cfg.runs_socket()) {
            if (cfg.notify == config::NotifyMode::Local) {
                if (cfg.mode != config::Mode::All) {
                    spdlog::warn("[LiveState] --notify local only observes writes made by this process");
                }
                gateway.set_write_listener([&notifier](const store::StoredDocument& doc) {
                    notifier.publish(doc.resource, doc.revision, doc.payload, doc.committed_at);
                });
            } else {
                notify::FeedOptions feed_opts;
                feed_opts.wait = cfg.feed_wait;
                feed = std::make_unique<notify::ChangeFeed>(gateway, notifier, feed_opts);
            }

            realtime::SocketServiceOptions svc_opts;
            svc_opts.session.idle_timeout = cfg.idle_timeout;
            svc_opts.session.max_outbound = cfg.max_outbound;
            socket_service = std::make_unique<realtime::SocketService>(ioc, workers, notifier, &gateway, svc_opts);

            networking::WebSocketServer::Options ws_opts;
            ws_opts.flush_timeout = cfg.flush_timeout;
            ws_server = std::make_unique<networking::WebSocketServer>(
                ioc, tcp::endpoint(asio::ip::make_address(cfg.socket_host), cfg.socket_port), ws_opts);
            ws_server->set_handler_factory([&socket_service](std::shared_ptr<networking::Connection> conn) {
                return socket_service->accept(std::move(conn));
            });
        }

        if (cfg.runs_http()) {
            networking::HttpServer::Options http_opts;
            http_opts.max_body_bytes = cfg.max_body_bytes;
            http_server = std::make_unique<networking::HttpServer>(
                ioc, workers, tcp::endpoint(asio::ip::make_address(cfg.http_host), cfg.http_port), http_opts);
            http_server->set_handler(api::ResourceHandler(gateway));
        }
    } catch (const boost::system::system_error& e) {
        spdlog::error("[LiveState] cannot listen: {}", e.what());
        return 1;
    }

    if (feed) feed->start();
    if (socket_service) socket_service->start();
    if (ws_server) {
        ws_server->start();
        spdlog::info("[LiveState] socket service on {}:{}", cfg.socket_host, ws_server->port());
    }
    if (http_server) {
        http_server->start();
        spdlog::info("[LiveState] HTTP service on {}:{}", cfg.http_host, http_server->port());
    }

    // Graceful shutdown on Ctrl+C / SIGTERM
    asio::steady_timer deadline(ioc);
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        spdlog::info("[LiveState] shutting down...");
        if (http_server) http_server->stop();
        // Sessions first so they flush what is buffered before the transport closes.
        if (socket_service) socket_service->stop();
        if (ws_server) ws_server->stop();

        // Sessions get their flush window, then whatever is left is cut.
        deadline.expires_after(cfg.flush_timeout + std::chrono::seconds(1));
        deadline.async_wait([&ioc](const boost::system::error_code& ec) {
            if (!ec) ioc.stop();
        });
    });

    std::vector<std::thread> threads;
    threads.reserve(cfg.threads > 0 ? cfg.threads - 1 : 0);
    for (unsigned i = 1; i < cfg.threads; ++i) {
        threads.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : threads) t.join();

    if (ws_server && ws_server->connections() > 0) {
        spdlog::warn("[LiveState] {} connection(s) still open after the flush window", ws_server->connections());
    }

    if (feed) feed->stop();
    workers.join();

    auto stats = notifier.stats();
    spdlog::info("[LiveState] exit. published={} delivered={} overflowed={} gaps={}",
                 stats.published, stats.delivered, stats.overflowed, stats.gaps);
    return 0;
}
