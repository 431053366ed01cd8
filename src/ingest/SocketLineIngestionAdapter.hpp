#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include "ingest/FrameDecoder.hpp"
#include "ingest/IngestionAdapter.hpp"

namespace helios {

struct SocketAdapterOptions {
    std::string socket_path;
    std::chrono::milliseconds reconnect_backoff{2000};
    std::chrono::milliseconds read_timeout{5000};
};

// ---------------------------------------------------------------------------
// Line-delimited JSON ingestion from a local bridge process.
//
// Dedicated worker thread, blocking connect/read loop. Each connection gets
// its own io_context; reads are async_read_some driven by run_for() so a
// silent peer is detected after read_timeout and stop() is honoured within
// one poll slice.
//
// Peer close, socket error and read timeout are all "connection lost":
// mark the store disconnected, wait reconnect_backoff, try again. There is
// no terminal state; only stop() ends the loop.
// ---------------------------------------------------------------------------
class SocketLineIngestionAdapter : public IngestionAdapter {
public:
    explicit SocketLineIngestionAdapter(SocketAdapterOptions opts);
    ~SocketLineIngestionAdapter() override;

    void start(TelemetryStore& store) override;
    void stop() override;

    const char* name() const override { return "socket"; }

    // Successful connections since start().
    uint64_t connections() const { return connections_.load(); }
    uint64_t frames_applied() const { return frames_applied_.load(); }
    uint64_t lines_dropped() const { return lines_dropped_.load(); }

private:
    void run();
    void read_until_lost(boost::asio::io_context& ioc,
                         boost::asio::local::stream_protocol::socket& sock);
    void handle_lines(const std::vector<std::string>& lines);
    void backoff();

    SocketAdapterOptions opts_;
    TelemetryStore*      store_{nullptr};
    LineBuffer           lines_;

    std::atomic<bool>     running_{false};
    std::atomic<uint64_t> connections_{0};
    std::atomic<uint64_t> frames_applied_{0};
    std::atomic<uint64_t> lines_dropped_{0};

    std::mutex              wake_mtx_;
    std::condition_variable wake_cv_;
    std::thread             worker_;
};

} // namespace helios
