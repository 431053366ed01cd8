#include "ingest/SocketLineIngestionAdapter.hpp"
#include "telemetry/TelemetryState.hpp"
#include <algorithm>
#include <array>
#include <iostream>
#include <boost/asio/buffer.hpp>
#include <boost/system/system_error.hpp>

using namespace helios;
namespace asio = boost::asio;
using stream_protocol = asio::local::stream_protocol;

// Upper bound on how long stop() can wait for a blocked read.
static constexpr auto POLL_SLICE = std::chrono::milliseconds(100);

static constexpr std::size_t READ_CHUNK = 4096;

SocketLineIngestionAdapter::SocketLineIngestionAdapter(SocketAdapterOptions opts)
    : opts_(std::move(opts)) {}

SocketLineIngestionAdapter::~SocketLineIngestionAdapter() {
    stop();
}

void SocketLineIngestionAdapter::start(TelemetryStore& store) {
    if (running_.exchange(true)) return;  // already running
    store_ = &store;
    worker_ = std::thread([this]() { run(); });
}

void SocketLineIngestionAdapter::stop() {
    if (!running_.exchange(false)) return;  // already stopped
    {
        std::lock_guard<std::mutex> lk(wake_mtx_);
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void SocketLineIngestionAdapter::run() {
    std::cout << "[SOCKET] Reading from " << opts_.socket_path << "\n";

    while (running_.load()) {
        TelemetryPatch connecting;
        connecting.connecting = true;
        connecting.connected  = false;
        store_->patch(connecting);

        asio::io_context ioc;
        stream_protocol::socket sock(ioc);

        try {
            sock.connect(stream_protocol::endpoint(opts_.socket_path));

            TelemetryPatch up;
            up.connecting = false;
            up.connected  = true;
            up.started_at = iso_utc_now();
            store_->patch(up);

            connections_.fetch_add(1);
            lines_.clear();
            std::cout << "[SOCKET] Connected to " << opts_.socket_path << "\n";

            read_until_lost(ioc, sock);
        } catch (const std::exception& e) {
            if (!running_.load()) break;

            std::cout << "[SOCKET] Connection lost (" << e.what() << "), reconnecting in "
                      << std::chrono::duration<double>(opts_.reconnect_backoff).count()
                      << "s...\n";

            TelemetryPatch down;
            down.connecting = false;
            down.connected  = false;
            store_->patch(down);

            boost::system::error_code ignored;
            sock.close(ignored);

            backoff();
        }
    }
}

void SocketLineIngestionAdapter::read_until_lost(asio::io_context& ioc,
                                                 stream_protocol::socket& sock) {
    std::array<char, READ_CHUNK> chunk;

    while (running_.load()) {
        bool done = false;
        std::size_t n = 0;
        boost::system::error_code read_ec;

        sock.async_read_some(asio::buffer(chunk),
            [&](const boost::system::error_code& ec, std::size_t bytes) {
                read_ec = ec;
                n       = bytes;
                done    = true;
            });

        auto deadline = std::chrono::steady_clock::now() + opts_.read_timeout;
        while (!done && running_.load()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) break;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            ioc.restart();
            ioc.run_for(std::min<std::chrono::milliseconds>(POLL_SLICE, left));
        }

        if (!done) {
            // Abort the outstanding read and let its handler run before the
            // locals it captured go away.
            boost::system::error_code ignored;
            sock.cancel(ignored);
            ioc.restart();
            ioc.run();
            if (!running_.load()) return;
            throw boost::system::system_error(asio::error::timed_out, "read timeout");
        }

        if (read_ec) throw boost::system::system_error(read_ec);
        if (n == 0) throw boost::system::system_error(asio::error::eof, "socket closed");

        std::size_t overflows = lines_.overflows();
        auto lines = lines_.feed(chunk.data(), n);
        if (lines_.overflows() != overflows) {
            lines_dropped_.fetch_add(lines_.overflows() - overflows);
            std::cerr << "[SOCKET] Discarded partial line over "
                      << LineBuffer::MAX_PENDING << " bytes\n";
        }
        handle_lines(lines);
    }
}

void SocketLineIngestionAdapter::handle_lines(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        auto patch = decode_frame(line);
        if (!patch) {
            lines_dropped_.fetch_add(1);
            continue;
        }
        store_->patch(*patch);
        frames_applied_.fetch_add(1);
    }
}

void SocketLineIngestionAdapter::backoff() {
    std::unique_lock<std::mutex> lk(wake_mtx_);
    wake_cv_.wait_for(lk, opts_.reconnect_backoff, [this]() { return !running_.load(); });
}
