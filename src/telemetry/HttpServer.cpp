#include "telemetry/HttpServer.hpp"
#include "telemetry/DistributionSession.hpp"
#include <chrono>
#include <iostream>
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <boost/system/system_error.hpp>

using namespace helios;
namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

static constexpr const char* SERVER_NAME = "helios";

HttpServer::HttpServer(Context& ctx)
    : ctx_(ctx), acceptor_(accept_ioc_) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (accept_thread_.joinable()) return;

    const tcp::endpoint ep(asio::ip::make_address(ctx_.config.http_host), ctx_.config.http_port);

    acceptor_.open(ep.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen();
    acceptor_.non_blocking(true);
    port_ = acceptor_.local_endpoint().port();

    std::cout << "[HTTP] Listening on " << ctx_.config.http_host << ":" << port_ << "\n";

    running_.store(true);
    accept_thread_ = std::thread([this]() { accept_loop(); });
}

void HttpServer::stop() {
    running_.store(false);
    if (!accept_thread_.joinable()) return;  // never started or already stopped

    accept_thread_.join();

    boost::system::error_code ignored;
    acceptor_.close(ignored);

    // Sessions watch running_ and wind down within one poll slice.
    reap_workers(true);
    std::cout << "[HTTP] Stopped\n";
}

std::size_t HttpServer::active_connections() const {
    std::lock_guard<std::mutex> lk(workers_mtx_);
    std::size_t n = 0;
    for (const auto& w : workers_)
        if (!w.done->load()) n++;
    return n;
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        // Service-wide shutdown: take every session down with the acceptor.
        if (!ctx_.running.load()) {
            std::cout << "[HTTP] Service stopping, closing connections\n";
            running_.store(false);
            break;
        }

        auto ioc = std::make_unique<asio::io_context>();

        boost::system::error_code ec;
        tcp::socket sock(*ioc);
        acceptor_.accept(sock, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            reap_workers(false);
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (ec) {
            std::cerr << "[HTTP] accept: " << ec.message() << "\n";
            continue;
        }

        // Accepted sockets inherit non-blocking mode on some platforms.
        sock.non_blocking(false, ec);

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([this, done, ioc = std::move(ioc), sock = std::move(sock)]() mutable {
            try {
                serve(std::move(ioc), std::move(sock));
            } catch (const std::exception& e) {
                std::cerr << "[HTTP] Connection error: " << e.what() << "\n";
            }
            done->store(true);
        });

        std::lock_guard<std::mutex> lk(workers_mtx_);
        workers_.push_back(Worker{std::move(t), done});
    }
}

void HttpServer::reap_workers(bool all) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lk(workers_mtx_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (all || it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished)
        if (w.thread.joinable()) w.thread.join();
}

// ---------------------------------------------------------------------------
// One connection, start to finish, on its own thread.
// ---------------------------------------------------------------------------
void HttpServer::serve(std::unique_ptr<asio::io_context> ioc, tcp::socket sock) {
    beast::flat_buffer buffer;
    Request req;

    bool done = false;
    boost::system::error_code read_ec;
    http::async_read(sock, buffer, req, [&](const boost::system::error_code& ec, std::size_t) {
        read_ec = ec;
        done    = true;
    });

    const auto deadline = std::chrono::steady_clock::now() + REQUEST_TIMEOUT;
    while (!done && running_.load() && std::chrono::steady_clock::now() < deadline) {
        ioc->restart();
        ioc->run_for(std::chrono::milliseconds(100));
    }

    if (!done) {
        boost::system::error_code ignored;
        sock.cancel(ignored);
        sock.close(ignored);
        ioc->restart();
        ioc->run();
        return;
    }
    if (read_ec) return;   // client went away or sent garbage

    const std::string target(req.target());
    const std::string path = target.substr(0, target.find('?'));

    if (websocket::is_upgrade(req)) {
        if (!is_stream_path(path)) {
            Response res = route(req);
            boost::system::error_code ec;
            http::write(sock, res, ec);
            return;
        }

        DistributionSession::WebSocket ws(std::move(sock));
        ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, SERVER_NAME);
        }));
        ws.accept(req);

        std::cout << "[HTTP] Stream client connected on " << path << "\n";
        DistributionSession session(ws, *ioc, ctx_.reader, ctx_.config.push_interval(), running_);
        session.run();
        return;
    }

    Response res = route(req);
    boost::system::error_code ec;
    http::write(sock, res, ec);
    sock.shutdown(tcp::socket::shutdown_send, ec);
}

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------
bool HttpServer::is_stream_path(const std::string& path) {
    return path == "/telemetry/stream" || path == "/ws/telemetry" ||
           path == "/api/telemetry/stream";
}

HttpServer::Response HttpServer::route(const Request& req) const {
    Response res{http::status::ok, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(false);

    const std::string target(req.target());
    std::string path = target.substr(0, target.find('?'));
    if (path.compare(0, 5, "/api/") == 0) path = path.substr(4);
    if (path.size() > 1 && path.back() == '/') path.pop_back();

    const bool known = path == "/telemetry" || path == "/telemetry/position" ||
                       path == "/telemetry/attitude" || path == "/telemetry/battery" ||
                       path == "/status";
    if (!known) {
        res.result(http::status::not_found);
        res.body() = nlohmann::json{{"error", "not found"}}.dump();
        res.prepare_payload();
        return res;
    }

    if (req.method() != http::verb::get) {
        res.result(http::status::method_not_allowed);
        res.set(http::field::allow, "GET");
        res.body() = nlohmann::json{{"error", "method not allowed"}}.dump();
        res.prepare_payload();
        return res;
    }

    nlohmann::json body;
    if (path == "/telemetry")               body = ctx_.reader.full();
    else if (path == "/telemetry/position") body = ctx_.reader.position();
    else if (path == "/telemetry/attitude") body = ctx_.reader.attitude();
    else if (path == "/telemetry/battery")  body = ctx_.reader.battery();
    else                                    body = ctx_.reader.status();

    res.body() = body.dump();
    res.prepare_payload();
    return res;
}
