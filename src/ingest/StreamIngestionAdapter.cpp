#include "ingest/StreamIngestionAdapter.hpp"
#include "telemetry/TelemetryState.hpp"
#include <cmath>
#include <iostream>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

using namespace helios;
namespace asio = boost::asio;

// ---------------------------------------------------------------------------
// Rate requests issued after connect, in order. The first failure ends the
// sequence; the autopilot keeps its default stream cadence.
// ---------------------------------------------------------------------------
namespace {

struct RateStep {
    RateMetric metric;
    bool       fixed_1hz;
};

constexpr RateStep RATE_PLAN[] = {
    {RateMetric::Position,    false},
    {RateMetric::Battery,     false},
    {RateMetric::Attitude,    false},
    {RateMetric::VelocityNed, false},
    {RateMetric::GpsInfo,     false},
    {RateMetric::Home,        true},
    {RateMetric::InAir,       true},
    {RateMetric::LandedState, true},
};

constexpr std::size_t RATE_PLAN_SIZE = sizeof(RATE_PLAN) / sizeof(RATE_PLAN[0]);

double round_to(double v, int places) {
    if (!std::isfinite(v)) return v;
    const double scale = std::pow(10.0, places);
    return std::round(v * scale) / scale;
}

bool is_terminal(StreamIngestionAdapter::Phase p) {
    return p == StreamIngestionAdapter::Phase::TimedOut ||
           p == StreamIngestionAdapter::Phase::Faulted;
}

}

const char* helios::to_string(StreamIngestionAdapter::Phase p) {
    switch (p) {
        case StreamIngestionAdapter::Phase::Idle:       return "idle";
        case StreamIngestionAdapter::Phase::Connecting: return "connecting";
        case StreamIngestionAdapter::Phase::Streaming:  return "streaming";
        case StreamIngestionAdapter::Phase::TimedOut:   return "timed_out";
        case StreamIngestionAdapter::Phase::Faulted:    return "faulted";
    }
    return "unknown";
}

StreamIngestionAdapter::StreamIngestionAdapter(StreamAdapterOptions opts, SourceFactory factory)
    : opts_(std::move(opts)), factory_(std::move(factory)), timer_(ioc_) {}

StreamIngestionAdapter::~StreamIngestionAdapter() {
    stop();
}

void StreamIngestionAdapter::start(TelemetryStore& store) {
    if (running_.exchange(true)) return;  // already running
    store_ = &store;
    worker_ = std::thread([this]() { run(); });
}

void StreamIngestionAdapter::stop() {
    if (!running_.exchange(false)) return;  // already stopped
    ioc_.stop();
    if (worker_.joinable()) worker_.join();
}

void StreamIngestionAdapter::run() {
    auto work = asio::make_work_guard(ioc_);

    try {
        source_ = factory_(ioc_);
    } catch (const std::exception& e) {
        std::cerr << "[STREAM] Could not create telemetry source: " << e.what() << "\n";
        TelemetryPatch p;
        p.connected  = false;
        p.connecting = false;
        store_->patch(p);
        phase_.store(Phase::TimedOut);
        return;
    }

    asio::post(ioc_, [this]() { begin_connect(); });

    // Handlers that escape the producer guards (link internals) land here.
    // A fault is terminal, so run() is not re-entered afterwards.
    while (running_.load()) {
        try {
            ioc_.run();
            break;
        } catch (const std::exception& e) {
            fail("link", e.what());
        }
    }

    if (source_) {
        source_->close();
        source_.reset();
    }
}

void StreamIngestionAdapter::begin_connect() {
    phase_.store(Phase::Connecting);

    TelemetryPatch p;
    p.connecting = true;
    p.connected  = false;
    store_->patch(p);

    source_->subscribe_connection_state([this](const ConnectionState& s) {
        on_connection_state(s);
    });
    source_->subscribe_fault([this](const std::string& what) {
        if (phase_.load() == Phase::Streaming) {
            fail("link", what);
        } else {
            std::cerr << "[STREAM] Link error while connecting: " << what << "\n";
        }
    });

    std::cout << "[STREAM] Listening on " << opts_.address << " ...\n";
    std::cout << "[STREAM] Waiting up to "
              << std::chrono::duration_cast<std::chrono::seconds>(opts_.connect_timeout).count()
              << "s for heartbeat\n";

    try {
        source_->connect(opts_.address);
    } catch (const SourceError& e) {
        std::cerr << "[STREAM] Connect failed: " << e.what() << "\n";
        TelemetryPatch down;
        down.connected  = false;
        down.connecting = false;
        store_->patch(down);
        log_timeout_diagnostics();
        give_up(Phase::TimedOut);
        return;
    }

    timer_.expires_after(opts_.connect_timeout);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        on_connect_timeout(ec);
    });
}

void StreamIngestionAdapter::on_connection_state(const ConnectionState& state) {
    // Only the first "connected" matters. Later heartbeats and losses do not
    // move this adapter out of Streaming.
    if (phase_.load() != Phase::Connecting || !state.is_connected) return;

    timer_.cancel();
    phase_.store(Phase::Streaming);

    TelemetryPatch p;
    p.connected  = true;
    p.connecting = false;
    p.started_at = iso_utc_now();
    store_->patch(p);

    std::cout << "[STREAM] Connected - requesting telemetry rates\n";
    negotiate_rate(0);
}

void StreamIngestionAdapter::on_connect_timeout(const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted) return;
    if (phase_.load() != Phase::Connecting) return;

    TelemetryPatch p;
    p.connected  = false;
    p.connecting = false;
    store_->patch(p);

    std::cerr << "[STREAM] No heartbeat received after "
              << std::chrono::duration_cast<std::chrono::seconds>(opts_.connect_timeout).count()
              << "s.\n";
    log_timeout_diagnostics();
    give_up(Phase::TimedOut);
}

void StreamIngestionAdapter::negotiate_rate(std::size_t index) {
    if (phase_.load() != Phase::Streaming) return;

    if (index == RATE_PLAN_SIZE) {
        std::cout << "[STREAM] Telemetry rates set to " << opts_.telemetry_rate_hz << " Hz\n";
        begin_settle();
        return;
    }

    const RateStep& step = RATE_PLAN[index];
    const double hz = step.fixed_1hz ? 1.0 : opts_.telemetry_rate_hz;

    source_->async_set_rate(step.metric, hz,
        [this, index](const boost::system::error_code& ec) {
            if (ec) {
                std::cerr << "[STREAM] Could not set telemetry rates ("
                          << to_string(RATE_PLAN[index].metric) << "): "
                          << ec.message() << "\n";
                std::cerr << "[STREAM]   (fine for SITL, but real hardware may not stream data)\n";
                begin_settle();
                return;
            }
            negotiate_rate(index + 1);
        });
}

void StreamIngestionAdapter::begin_settle() {
    if (phase_.load() != Phase::Streaming) return;

    timer_.expires_after(opts_.settle_delay);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || phase_.load() != Phase::Streaming) return;
        begin_streaming();
    });
}

void StreamIngestionAdapter::begin_streaming() {
    source_->subscribe_position([this](const PositionSample& s) {
        guarded("position", [&]() { on_position(s); });
    });
    source_->subscribe_attitude([this](const AttitudeSample& s) {
        guarded("attitude", [&]() { on_attitude(s); });
    });
    source_->subscribe_battery([this](const BatterySample& s) {
        guarded("battery", [&]() { on_battery(s); });
    });

    std::cout << "[STREAM] Streaming telemetry\n";
}

template <typename Fn>
void StreamIngestionAdapter::guarded(const char* stream, Fn&& fn) {
    if (phase_.load() != Phase::Streaming) return;
    try {
        fn();
    } catch (const std::exception& e) {
        fail(std::string(stream) + " stream", e.what());
    }
}

void StreamIngestionAdapter::on_position(const PositionSample& s) {
    PositionGroup g;
    g.latitude_deg        = round_to(s.latitude_deg, 7);
    g.longitude_deg       = round_to(s.longitude_deg, 7);
    g.absolute_altitude_m = round_to(s.absolute_altitude_m, 2);
    g.relative_altitude_m = round_to(s.relative_altitude_m, 2);

    TelemetryPatch p;
    p.position = g;
    store_->patch(p);
}

void StreamIngestionAdapter::on_attitude(const AttitudeSample& s) {
    AttitudeGroup g;
    g.roll_deg  = round_to(s.roll_deg, 2);
    g.pitch_deg = round_to(s.pitch_deg, 2);
    g.yaw_deg   = round_to(s.yaw_deg, 2);

    TelemetryPatch p;
    p.attitude = g;
    store_->patch(p);
}

void StreamIngestionAdapter::on_battery(const BatterySample& s) {
    BatteryGroup g;
    g.voltage_v         = round_to(s.voltage_v, 2);
    g.remaining_percent = round_to(s.remaining_percent, 4);

    TelemetryPatch p;
    p.battery = g;
    store_->patch(p);
}

void StreamIngestionAdapter::give_up(Phase terminal) {
    phase_.store(terminal);
    timer_.cancel();
    if (source_) source_->close();
    ioc_.stop();
}

void StreamIngestionAdapter::fail(const std::string& origin, const std::string& what) {
    if (is_terminal(phase_.load())) return;

    std::cerr << "[STREAM] " << origin << " failed: " << what
              << " - ingestion stopped, no retry\n";

    TelemetryPatch p;
    p.connected  = false;
    p.connecting = false;
    p.fault      = origin + ": " + what;
    store_->patch(p);

    give_up(Phase::Faulted);
}

void StreamIngestionAdapter::log_timeout_diagnostics() const {
    std::cerr << "  Troubleshooting:\n";
    if (opts_.address.rfind("serial", 0) == 0) {
        std::cerr << "  1. Check that the autopilot is powered and the USB cable is connected\n";
        std::cerr << "  2. Verify the serial device exists (ls /dev/ttyACM* /dev/ttyUSB*)\n";
        std::cerr << "  3. Check baud rate - common values: 57600, 115200, 921600\n";
        std::cerr << "  4. Current address: " << opts_.address << "\n";
    } else {
        std::cerr << "  1. In your ground station, add a UDP output to this host's port\n";
        std::cerr << "  2. Or try a different port (14550, 14540)\n";
        std::cerr << "  3. Make sure the vehicle/SITL is connected to the ground station first\n";
        std::cerr << "  4. Current address: " << opts_.address << "\n";
    }
}
