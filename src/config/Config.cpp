#include "config/Config.h"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <map>
#include <thread>

namespace livestate::config {

const char* to_string(Mode m) noexcept {
    switch (m) {
        case Mode::Http:   return "http";
        case Mode::Socket: return "socket";
        case Mode::All:    return "all";
    }
    return "unknown";
}

void Config::dump(std::ostream& os) const {
    os << "mode=" << to_string(mode)
       << " http=" << http_host << ":" << http_port
       << " socket=" << socket_host << ":" << socket_port
       << " store=" << (store == StoreBackend::Couch ? "couch" : "memory")
       << " store_endpoint=" << store_host << ":" << store_port << "/" << store_db
       << " notify=" << (notify == NotifyMode::Feed ? "feed" : "local")
       << " threads=" << threads
       << " log_level=" << log_level;
}

ParseResult parse(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    CLI::App app{"LiveState: HTTP writes propagated to WebSocket subscribers through a shared store"};
    ParseResult result;
    Config& c = result.config;

    bool http = false;
    bool socket = false;
    app.add_flag("--http", http, "Run the HTTP service");
    app.add_flag("--socket", socket, "Run the socket service");

    app.add_option("--http-host", c.http_host, "HTTP listen address")
        ->envname("LIVESTATE_HTTP_HOST")->capture_default_str();
    app.add_option("--http-port", c.http_port, "HTTP listen port")
        ->envname("LIVESTATE_HTTP_PORT")->capture_default_str();
    app.add_option("--socket-host", c.socket_host, "WebSocket listen address")
        ->envname("LIVESTATE_SOCKET_HOST")->capture_default_str();
    app.add_option("--socket-port", c.socket_port, "WebSocket listen port")
        ->envname("LIVESTATE_SOCKET_PORT")->capture_default_str();

    const std::map<std::string, StoreBackend> backends{{"couch", StoreBackend::Couch}, {"memory", StoreBackend::Memory}};
    app.add_option("--store", c.store, "Store backend: couch | memory")
        ->envname("LIVESTATE_STORE")
        ->transform(CLI::CheckedTransformer(backends, CLI::ignore_case));
    app.add_option("--store-host", c.store_host, "Document store host")
        ->envname("LIVESTATE_STORE_HOST")->capture_default_str();
    app.add_option("--store-port", c.store_port, "Document store port")
        ->envname("LIVESTATE_STORE_PORT")->capture_default_str();
    app.add_option("--store-db", c.store_db, "Database name")
        ->envname("LIVESTATE_STORE_DB")->capture_default_str();
    app.add_option("--store-user", c.store_user, "Store user (basic auth)")
        ->envname("LIVESTATE_STORE_USER");
    app.add_option("--store-password", c.store_password, "Store password (basic auth)")
        ->envname("LIVESTATE_STORE_PASSWORD");

    std::int64_t store_timeout_ms = c.store_timeout.count();
    app.add_option("--store-timeout-ms", store_timeout_ms, "Per-request store timeout")
        ->envname("LIVESTATE_STORE_TIMEOUT_MS")->check(CLI::PositiveNumber)->capture_default_str();
    app.add_option("--store-pool", c.store_pool, "Idle store connections kept")
        ->envname("LIVESTATE_STORE_POOL")->capture_default_str();

    std::int64_t retry_base_ms = c.retry_base.count();
    std::int64_t retry_max_ms = c.retry_max.count();
    app.add_option("--retry-attempts", c.retry_attempts, "Attempts for transient store failures")
        ->envname("LIVESTATE_RETRY_ATTEMPTS")->check(CLI::Range(1, 10))->capture_default_str();
    app.add_option("--retry-base-ms", retry_base_ms, "First retry delay")
        ->envname("LIVESTATE_RETRY_BASE_MS")->check(CLI::NonNegativeNumber)->capture_default_str();
    app.add_option("--retry-max-ms", retry_max_ms, "Retry delay cap")
        ->envname("LIVESTATE_RETRY_MAX_MS")->check(CLI::NonNegativeNumber)->capture_default_str();

    const std::map<std::string, NotifyMode> notify_modes{{"feed", NotifyMode::Feed}, {"local", NotifyMode::Local}};
    app.add_option("--notify", c.notify, "Change source: feed (store change feed) | local (same-process writes)")
        ->envname("LIVESTATE_NOTIFY")
        ->transform(CLI::CheckedTransformer(notify_modes, CLI::ignore_case));

    std::int64_t feed_wait_ms = c.feed_wait.count();
    std::int64_t reorder_window_ms = c.reorder_window.count();
    std::int64_t idle_timeout_ms = c.idle_timeout.count();
    std::int64_t flush_timeout_ms = c.flush_timeout.count();
    app.add_option("--feed-wait-ms", feed_wait_ms, "Change feed long-poll duration")
        ->envname("LIVESTATE_FEED_WAIT_MS")->check(CLI::PositiveNumber)->capture_default_str();
    app.add_option("--reorder-window-ms", reorder_window_ms, "Wait for a missing revision before skipping it")
        ->envname("LIVESTATE_REORDER_WINDOW_MS")->check(CLI::NonNegativeNumber)->capture_default_str();
    app.add_option("--idle-timeout-ms", idle_timeout_ms, "Close sessions silent for this long")
        ->envname("LIVESTATE_IDLE_TIMEOUT_MS")->check(CLI::PositiveNumber)->capture_default_str();
    app.add_option("--flush-timeout-ms", flush_timeout_ms, "Bound on flushing queued frames at close")
        ->envname("LIVESTATE_FLUSH_TIMEOUT_MS")->check(CLI::NonNegativeNumber)->capture_default_str();
    app.add_option("--subscriber-buffer", c.subscriber_buffer, "Events buffered per subscription")
        ->envname("LIVESTATE_SUBSCRIBER_BUFFER")->check(CLI::PositiveNumber)->capture_default_str();
    app.add_option("--max-outbound", c.max_outbound, "Frames queued per connection")
        ->envname("LIVESTATE_MAX_OUTBOUND")->check(CLI::PositiveNumber)->capture_default_str();
    app.add_option("--max-body-bytes", c.max_body_bytes, "HTTP request body limit")
        ->envname("LIVESTATE_MAX_BODY_BYTES")->check(CLI::PositiveNumber)->capture_default_str();

    app.add_option("--threads", c.threads, "I/O threads (0: hardware concurrency)")
        ->envname("LIVESTATE_THREADS")->capture_default_str();
    app.add_option("-l,--log-level", c.log_level, "Log level: trace | debug | info | warn | error")
        ->envname("LIVESTATE_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
        ->capture_default_str();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        result.ok = false;
        result.exit_code = app.exit(e, out, err);
        return result;
    }

    if (http && socket) {
        err << "Please specify only one server at a time.\n";
        result.ok = false;
        result.exit_code = 2;
        return result;
    }
    c.mode = http ? Mode::Http : socket ? Mode::Socket : Mode::All;

    c.store_timeout = std::chrono::milliseconds(store_timeout_ms);
    c.retry_base = std::chrono::milliseconds(retry_base_ms);
    c.retry_max = std::chrono::milliseconds(retry_max_ms);
    c.feed_wait = std::chrono::milliseconds(feed_wait_ms);
    c.reorder_window = std::chrono::milliseconds(reorder_window_ms);
    c.idle_timeout = std::chrono::milliseconds(idle_timeout_ms);
    c.flush_timeout = std::chrono::milliseconds(flush_timeout_ms);

    if (c.threads == 0) c.threads = std::max(1u, std::thread::hardware_concurrency());

    return result;
}

} // namespace livestate::config
