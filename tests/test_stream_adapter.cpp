#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <limits>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "ingest/StreamIngestionAdapter.hpp"
#include "telemetry/TelemetryState.hpp"

using namespace helios;
namespace asio = boost::asio;
using namespace std::chrono_literals;

namespace {

// What the scripted source should do. Shared with the test thread.
struct Script {
    bool connects{true};
    std::chrono::milliseconds connect_delay{20};
    bool throw_on_connect{false};
    int reject_rate_at{-1};

    std::mutex mtx;
    std::vector<std::pair<RateMetric, double>> rate_requests;

    std::atomic<int>  connect_calls{0};
    std::atomic<bool> producers_subscribed{false};
    std::atomic<bool> closed{false};
};

// TelemetrySource driven entirely from the adapter's io_context.
class ScriptedSource : public TelemetrySource {
public:
    ScriptedSource(asio::io_context& ioc, Script& script)
        : ioc_(ioc), script_(script), timer_(ioc) {}

    void connect(const std::string&) override {
        script_.connect_calls++;
        if (script_.throw_on_connect) throw SourceError("no such port");
        if (!script_.connects) return;

        timer_.expires_after(script_.connect_delay);
        timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !on_state_) return;
            ConnectionState s;
            s.is_connected = true;
            on_state_(s);
        });
    }

    void subscribe_connection_state(ConnectionHandler h) override { on_state_ = std::move(h); }

    void async_set_rate(RateMetric metric, double hz, RateHandler handler) override {
        int index;
        {
            std::lock_guard<std::mutex> lk(script_.mtx);
            index = static_cast<int>(script_.rate_requests.size());
            script_.rate_requests.emplace_back(metric, hz);
        }
        boost::system::error_code ec;
        if (index == script_.reject_rate_at) ec = make_error_code(SourceErrc::rate_rejected);
        asio::post(ioc_, [handler, ec]() { handler(ec); });
    }

    void subscribe_position(PositionHandler h) override {
        on_position_ = std::move(h);
        script_.producers_subscribed = true;
    }
    void subscribe_attitude(AttitudeHandler h) override { on_attitude_ = std::move(h); }
    void subscribe_battery(BatteryHandler h) override { on_battery_ = std::move(h); }
    void subscribe_fault(FaultHandler h) override { on_fault_ = std::move(h); }

    void close() override {
        timer_.cancel();
        script_.closed = true;
    }

    ConnectionHandler on_state_;
    PositionHandler   on_position_;
    AttitudeHandler   on_attitude_;
    BatteryHandler    on_battery_;
    FaultHandler      on_fault_;

private:
    asio::io_context&  ioc_;
    Script&            script_;
    asio::steady_timer timer_;
};

bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds limit = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

class StreamAdapterTest : public ::testing::Test {
protected:
    void start() {
        StreamAdapterOptions opts;
        opts.address           = "udpin://0.0.0.0:14551";
        opts.connect_timeout   = connect_timeout;
        opts.telemetry_rate_hz = 4.0;
        opts.settle_delay      = 10ms;

        adapter = std::make_unique<StreamIngestionAdapter>(opts,
            [this](asio::io_context& ioc) -> std::unique_ptr<TelemetrySource> {
                auto src = std::make_unique<ScriptedSource>(ioc, script);
                source = src.get();
                ioc_ptr = &ioc;
                return src;
            });
        adapter->start(store);
    }

    // Runs `fn` on the adapter's worker, as the source would.
    void on_worker(std::function<void()> fn) {
        asio::post(*ioc_ptr.load(), std::move(fn));
    }

    void TearDown() override {
        if (adapter) adapter->stop();
    }

    std::chrono::milliseconds connect_timeout{2000};
    Script script;
    TelemetryStore store;
    std::atomic<ScriptedSource*> source{nullptr};
    std::atomic<asio::io_context*> ioc_ptr{nullptr};
    std::unique_ptr<StreamIngestionAdapter> adapter;
};

}

TEST_F(StreamAdapterTest, ConnectsNegotiatesRatesAndStreams) {
    start();

    ASSERT_TRUE(wait_for([&]() { return script.producers_subscribed.load(); }));
    EXPECT_EQ(adapter->phase(), StreamIngestionAdapter::Phase::Streaming);

    TelemetryState s = store.snapshot();
    EXPECT_TRUE(s.connected);
    EXPECT_FALSE(s.connecting);
    EXPECT_TRUE(s.started_at.has_value());

    std::lock_guard<std::mutex> lk(script.mtx);
    ASSERT_EQ(script.rate_requests.size(), 8u);
    EXPECT_EQ(script.rate_requests[0].first, RateMetric::Position);
    EXPECT_EQ(script.rate_requests[1].first, RateMetric::Battery);
    EXPECT_EQ(script.rate_requests[2].first, RateMetric::Attitude);
    EXPECT_EQ(script.rate_requests[3].first, RateMetric::VelocityNed);
    EXPECT_EQ(script.rate_requests[4].first, RateMetric::GpsInfo);
    EXPECT_EQ(script.rate_requests[5].first, RateMetric::Home);
    EXPECT_EQ(script.rate_requests[6].first, RateMetric::InAir);
    EXPECT_EQ(script.rate_requests[7].first, RateMetric::LandedState);
    for (int i = 0; i < 5; ++i) EXPECT_EQ(script.rate_requests[i].second, 4.0);
    for (int i = 5; i < 8; ++i) EXPECT_EQ(script.rate_requests[i].second, 1.0);
}

TEST_F(StreamAdapterTest, RateFailureStopsSequenceButStillStreams) {
    script.reject_rate_at = 1;
    start();

    ASSERT_TRUE(wait_for([&]() { return script.producers_subscribed.load(); }));
    EXPECT_EQ(adapter->phase(), StreamIngestionAdapter::Phase::Streaming);

    std::lock_guard<std::mutex> lk(script.mtx);
    EXPECT_EQ(script.rate_requests.size(), 2u);
}

TEST_F(StreamAdapterTest, ProducersRoundAndPatchTheirGroups) {
    start();
    ASSERT_TRUE(wait_for([&]() { return script.producers_subscribed.load(); }));

    on_worker([this]() {
        PositionSample p;
        p.latitude_deg        = 34.05123456;
        p.longitude_deg       = -118.24000004;
        p.absolute_altitude_m = 100.456;
        p.relative_altitude_m = 10.004;
        source.load()->on_position_(p);

        AttitudeSample a;
        a.roll_deg  = 1.234;
        a.pitch_deg = -0.006;
        a.yaw_deg   = 271.999;
        source.load()->on_attitude_(a);

        BatterySample b;
        b.voltage_v         = 12.346;
        b.remaining_percent = 0.87654;
        source.load()->on_battery_(b);
    });

    ASSERT_TRUE(wait_for([&]() { return store.snapshot().battery.voltage_v.has_value(); }));
    TelemetryState s = store.snapshot();

    EXPECT_DOUBLE_EQ(*s.position.latitude_deg, 34.0512346);
    EXPECT_DOUBLE_EQ(*s.position.longitude_deg, -118.24);
    EXPECT_DOUBLE_EQ(*s.position.absolute_altitude_m, 100.46);
    EXPECT_DOUBLE_EQ(*s.position.relative_altitude_m, 10.0);
    EXPECT_DOUBLE_EQ(*s.attitude.roll_deg, 1.23);
    EXPECT_DOUBLE_EQ(*s.attitude.pitch_deg, -0.01);
    EXPECT_DOUBLE_EQ(*s.attitude.yaw_deg, 272.0);
    EXPECT_DOUBLE_EQ(*s.battery.voltage_v, 12.35);
    EXPECT_DOUBLE_EQ(*s.battery.remaining_percent, 0.8765);
}

TEST_F(StreamAdapterTest, UnknownBatteryRemainingStaysNull) {
    start();
    ASSERT_TRUE(wait_for([&]() { return script.producers_subscribed.load(); }));

    on_worker([this]() {
        BatterySample b;
        b.voltage_v         = 11.1;
        b.remaining_percent = std::numeric_limits<double>::quiet_NaN();
        source.load()->on_battery_(b);
    });

    ASSERT_TRUE(wait_for([&]() { return store.snapshot().battery.voltage_v.has_value(); }));
    EXPECT_TRUE(store.get({"battery"})["battery"]["remaining_percent"].is_null());
}

TEST_F(StreamAdapterTest, NeverConnectedTimesOutWithoutRetry) {
    script.connects = false;
    connect_timeout = 150ms;
    start();

    ASSERT_TRUE(wait_for([&]() {
        return adapter->phase() == StreamIngestionAdapter::Phase::TimedOut;
    }));

    TelemetryState s = store.snapshot();
    EXPECT_FALSE(s.connected);
    EXPECT_FALSE(s.connecting);
    EXPECT_FALSE(s.started_at.has_value());

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(script.connect_calls.load(), 1);
    EXPECT_TRUE(script.closed.load());
}

TEST_F(StreamAdapterTest, RejectedAddressIsTreatedLikeTimeout) {
    script.throw_on_connect = true;
    start();

    ASSERT_TRUE(wait_for([&]() {
        return adapter->phase() == StreamIngestionAdapter::Phase::TimedOut;
    }));
    TelemetryState s = store.snapshot();
    EXPECT_FALSE(s.connected);
    EXPECT_FALSE(s.connecting);
    EXPECT_EQ(script.connect_calls.load(), 1);
}

TEST_F(StreamAdapterTest, FactoryFailureIsTerminal) {
    adapter = std::make_unique<StreamIngestionAdapter>(StreamAdapterOptions{},
        [](asio::io_context&) -> std::unique_ptr<TelemetrySource> {
            throw std::runtime_error("no transport");
        });
    adapter->start(store);

    ASSERT_TRUE(wait_for([&]() {
        return adapter->phase() == StreamIngestionAdapter::Phase::TimedOut;
    }));
    EXPECT_FALSE(store.snapshot().connected);
}

TEST_F(StreamAdapterTest, LinkFaultAfterConnectIsTerminalAndVisible) {
    start();
    ASSERT_TRUE(wait_for([&]() { return script.producers_subscribed.load(); }));

    on_worker([this]() { source.load()->on_fault_("read: connection reset"); });

    ASSERT_TRUE(wait_for([&]() {
        return adapter->phase() == StreamIngestionAdapter::Phase::Faulted;
    }));
    TelemetryState s = store.snapshot();
    EXPECT_FALSE(s.connected);
    EXPECT_FALSE(s.connecting);
    ASSERT_TRUE(s.fault.has_value());
    EXPECT_EQ(*s.fault, "link: read: connection reset");
    EXPECT_TRUE(script.closed.load());
}

TEST_F(StreamAdapterTest, EscapedHandlerExceptionFaultsTheAdapter) {
    start();
    ASSERT_TRUE(wait_for([&]() { return script.producers_subscribed.load(); }));

    on_worker([]() { throw std::runtime_error("decoder exploded"); });

    ASSERT_TRUE(wait_for([&]() {
        return adapter->phase() == StreamIngestionAdapter::Phase::Faulted;
    }));
    EXPECT_EQ(store.snapshot().fault.value(), "link: decoder exploded");
}

TEST_F(StreamAdapterTest, StopWhileConnectingReturnsPromptly) {
    script.connects = false;
    connect_timeout = 60000ms;
    start();
    ASSERT_TRUE(wait_for([&]() { return script.connect_calls.load() == 1; }));

    auto t0 = std::chrono::steady_clock::now();
    adapter->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1000ms);
    EXPECT_EQ(adapter->phase(), StreamIngestionAdapter::Phase::Connecting);
}
