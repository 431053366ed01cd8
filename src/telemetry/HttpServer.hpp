#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "runtime/Context.hpp"

namespace helios {

// ---------------------------------------------------------------------------
// REST + live-stream front end.
//
// One accept thread polls a non-blocking acceptor. Every accepted
// connection gets its own thread and io_context, reads one request and
// either answers it (Connection: close) or upgrades to a WebSocket and
// becomes a DistributionSession for the rest of its life.
//
//   GET /telemetry                   full snapshot
//   GET /telemetry/{position,attitude,battery}
//   GET /status
//   (the same under /api)
//   WS  /telemetry/stream, /ws/telemetry
// ---------------------------------------------------------------------------
class HttpServer {
public:
    using Request  = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    explicit HttpServer(Context& ctx);
    ~HttpServer();

    // Binds and starts accepting. Serving also ends on its own once
    // Context::running is cleared; stop() still joins.
    // Throws boost::system::system_error when the listen address is unusable.
    void start();
    void stop();

    // Bound port; differs from the configured one only when that was 0.
    uint16_t port() const { return port_; }

    std::size_t active_connections() const;

    // Pure routing for plain HTTP requests.
    Response route(const Request& req) const;

    static bool is_stream_path(const std::string& path);

    static constexpr std::chrono::seconds REQUEST_TIMEOUT{10};

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void serve(std::unique_ptr<boost::asio::io_context> ioc,
               boost::asio::ip::tcp::socket sock);
    void reap_workers(bool all);

    Context& ctx_;

    boost::asio::io_context        accept_ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t                       port_{0};

    std::atomic<bool> running_{false};
    std::thread       accept_thread_;

    mutable std::mutex workers_mtx_;
    std::list<Worker>  workers_;
};

} // namespace helios
