#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "telemetry/SubscriptionFilter.hpp"

namespace helios {

class SnapshotReader;

// ---------------------------------------------------------------------------
// One live-stream client.
//
// Runs on the connection's own thread with the connection's own io_context,
// so polling it never executes another client's handlers. Each tick:
//   1. apply a control message if one arrived (non-blocking)
//   2. read the filtered snapshot from the store
//   3. send it as one text frame
// then sleep until the next tick, still collecting inbound messages.
//
// A failed send or a closed read side ends this session only. A slow client
// stretches its own ticks; nothing is queued for it.
// ---------------------------------------------------------------------------
class DistributionSession {
public:
    using WebSocket = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;

    DistributionSession(WebSocket& ws,
                        boost::asio::io_context& ioc,
                        const SnapshotReader& reader,
                        std::chrono::microseconds interval,
                        const std::atomic<bool>& running);

    // Returns when the client goes away or `running` drops.
    void run();

    uint64_t frames_sent() const { return frames_sent_; }
    const SubscriptionFilter& filter() const { return filter_; }

private:
    void arm_read();
    bool drain_inbound();
    bool send_frame();
    bool wait_until(std::chrono::steady_clock::time_point deadline);

    WebSocket&                 ws_;
    boost::asio::io_context&   ioc_;
    const SnapshotReader&      reader_;
    std::chrono::microseconds  interval_;
    const std::atomic<bool>&   running_;

    SubscriptionFilter filter_;

    boost::beast::flat_buffer inbound_;
    bool read_pending_{false};
    bool read_done_{false};
    boost::system::error_code read_ec_;
    std::string read_msg_;

    uint64_t frames_sent_{0};
};

} // namespace helios
