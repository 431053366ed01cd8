#include "telemetry/DistributionSession.hpp"
#include "telemetry/SnapshotReader.hpp"
#include <algorithm>
#include <iostream>
#include <boost/asio/buffer.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket/error.hpp>

using namespace helios;
namespace asio      = boost::asio;
namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using steady = std::chrono::steady_clock;

// Longest stretch the session blocks without checking `running`.
static constexpr std::chrono::microseconds POLL_SLICE{50000};

DistributionSession::DistributionSession(WebSocket& ws,
                                         asio::io_context& ioc,
                                         const SnapshotReader& reader,
                                         std::chrono::microseconds interval,
                                         const std::atomic<bool>& running)
    : ws_(ws), ioc_(ioc), reader_(reader), interval_(interval), running_(running) {}

void DistributionSession::run() {
    ws_.text(true);
    arm_read();

    auto next = steady::now();
    while (running_.load()) {
        if (!drain_inbound()) break;
        if (!send_frame()) break;

        next += interval_;
        auto now = steady::now();
        if (next < now) next = now;   // slow client: skip, don't burst

        if (!wait_until(next)) break;
    }

    // Abort whatever is still in flight and let the handlers finish before
    // the members they reference go away.
    boost::system::error_code ignored;
    ws_.next_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    ws_.next_layer().close(ignored);
    ioc_.restart();
    ioc_.run();

    std::cout << "[SESSION] Closed after " << frames_sent_ << " frames\n";
}

void DistributionSession::arm_read() {
    if (read_pending_) return;
    read_pending_ = true;
    read_done_    = false;

    ws_.async_read(inbound_, [this](const boost::system::error_code& ec, std::size_t) {
        read_ec_ = ec;
        if (!ec) read_msg_ = beast::buffers_to_string(inbound_.data());
        inbound_.consume(inbound_.size());
        read_done_ = true;
    });
}

bool DistributionSession::drain_inbound() {
    ioc_.restart();
    ioc_.poll();

    if (!read_done_) return true;
    read_pending_ = false;

    if (read_ec_) {
        if (read_ec_ != websocket::error::closed)
            std::cout << "[SESSION] Read ended: " << read_ec_.message() << "\n";
        return false;
    }

    if (filter_.apply(read_msg_)) {
        std::cout << "[SESSION] Subscribed: " << filter_.describe() << "\n";
    }
    read_msg_.clear();

    arm_read();
    return true;
}

bool DistributionSession::send_frame() {
    const std::string text = reader_.stream_frame(filter_).dump();

    bool done = false;
    boost::system::error_code write_ec;
    ws_.async_write(asio::buffer(text),
        [&](const boost::system::error_code& ec, std::size_t) {
            write_ec = ec;
            done     = true;
        });

    while (!done) {
        ioc_.restart();
        if (ioc_.run_one_for(POLL_SLICE) == 0 && !running_.load()) {
            boost::system::error_code ignored;
            ws_.next_layer().cancel(ignored);
        }
    }

    if (write_ec) {
        std::cout << "[SESSION] Client disconnected (" << write_ec.message() << ")\n";
        return false;
    }
    frames_sent_++;
    return true;
}

bool DistributionSession::wait_until(steady::time_point deadline) {
    while (running_.load()) {
        auto now = steady::now();
        if (now >= deadline) return true;

        auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);
        ioc_.restart();
        ioc_.run_for(std::min(left, POLL_SLICE));

        if (read_done_ && !drain_inbound()) return false;
    }
    return false;
}
