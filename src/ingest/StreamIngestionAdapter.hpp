#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "ingest/IngestionAdapter.hpp"
#include "ingest/TelemetrySource.hpp"

namespace helios {

struct StreamAdapterOptions {
    std::string address;
    std::chrono::milliseconds connect_timeout{30000};
    double telemetry_rate_hz{2.0};
    std::chrono::milliseconds settle_delay{2000};
};

// ---------------------------------------------------------------------------
// Push-stream ingestion.
//
// Runs one io_context on one worker thread. That io_context is the whole
// cooperative scheduler: the source's link I/O, the connect timeout, the
// rate negotiation chain, the settle timer and the three producer handlers
// (position / attitude / battery) all execute on it.
//
//   Idle -> Connecting -> Streaming
//              |              |
//              v              v
//          TimedOut        Faulted
//
// TimedOut and Faulted are terminal for this instance. There is no retry:
// the service keeps serving whatever the store last held, and a fault after
// connect is written to the store's `fault` field.
// ---------------------------------------------------------------------------
class StreamIngestionAdapter : public IngestionAdapter {
public:
    enum class Phase { Idle, Connecting, Streaming, TimedOut, Faulted };

    StreamIngestionAdapter(StreamAdapterOptions opts, SourceFactory factory);
    ~StreamIngestionAdapter() override;

    void start(TelemetryStore& store) override;
    void stop() override;

    const char* name() const override { return "stream"; }

    Phase phase() const { return phase_.load(); }

private:
    void run();
    void begin_connect();
    void on_connection_state(const ConnectionState& state);
    void on_connect_timeout(const boost::system::error_code& ec);
    void negotiate_rate(std::size_t index);
    void begin_settle();
    void begin_streaming();

    void on_position(const PositionSample& s);
    void on_attitude(const AttitudeSample& s);
    void on_battery(const BatterySample& s);

    template <typename Fn>
    void guarded(const char* stream, Fn&& fn);

    void give_up(Phase terminal);
    void fail(const std::string& origin, const std::string& what);
    void log_timeout_diagnostics() const;

    StreamAdapterOptions opts_;
    SourceFactory        factory_;
    TelemetryStore*      store_{nullptr};

    // Declaration order matters: source_ and timer_ reference ioc_ and
    // must be destroyed first.
    boost::asio::io_context          ioc_;
    boost::asio::steady_timer        timer_;
    std::unique_ptr<TelemetrySource> source_;

    std::atomic<Phase> phase_{Phase::Idle};
    std::atomic<bool>  running_{false};
    std::thread        worker_;
};

const char* to_string(StreamIngestionAdapter::Phase p);

} // namespace helios
