#include "mavsdk/MavsdkSource.hpp"
#include <iostream>
#include <sstream>
#include <utility>
#include <boost/asio/post.hpp>

using namespace helios;
namespace asio = boost::asio;

namespace {

boost::system::error_code to_error_code(mavsdk::Telemetry::Result r) {
    switch (r) {
        case mavsdk::Telemetry::Result::Success:
            return {};
        case mavsdk::Telemetry::Result::Timeout:
            return make_error_code(SourceErrc::rate_timeout);
        case mavsdk::Telemetry::Result::NoSystem:
        case mavsdk::Telemetry::Result::ConnectionError:
            return make_error_code(SourceErrc::not_connected);
        default:
            return make_error_code(SourceErrc::rate_rejected);
    }
}

}

MavsdkSource::MavsdkSource(asio::io_context& ioc)
    : ioc_(ioc), alive_(std::make_shared<std::atomic<bool>>(true)) {}

MavsdkSource::~MavsdkSource() {
    close();
}

template <typename Fn>
void MavsdkSource::dispatch(Fn&& fn) {
    auto alive = alive_;
    asio::post(ioc_, [alive, fn = std::forward<Fn>(fn)]() mutable {
        if (alive->load()) fn();
    });
}

void MavsdkSource::connect(const std::string& address) {
    mavsdk_ = std::make_unique<mavsdk::Mavsdk>(
        mavsdk::Mavsdk::Configuration{mavsdk::Mavsdk::ComponentType::GroundStation});

    error_handle_ = mavsdk_->subscribe_connection_errors(
        [this](mavsdk::Mavsdk::ConnectionError err) {
            dispatch([this, what = err.error_description]() {
                std::cerr << "[MAVSDK] Link fault: " << what << "\n";
                if (on_fault_) on_fault_(what);
            });
        });

    new_system_handle_ = mavsdk_->subscribe_on_new_system([this]() {
        dispatch([this]() { on_new_system(); });
    });

    const mavsdk::ConnectionResult result = mavsdk_->add_any_connection(address);
    if (result != mavsdk::ConnectionResult::Success) {
        release_link();
        std::ostringstream msg;
        msg << address << ": " << result;
        throw SourceError(msg.str());
    }

    std::cout << "[MAVSDK] Connection added: " << address << "\n";
}

void MavsdkSource::on_new_system() {
    if (telemetry_ || !mavsdk_) return;

    for (auto& system : mavsdk_->systems()) {
        if (system->has_autopilot()) {
            attach(system);
            return;
        }
    }
}

void MavsdkSource::attach(std::shared_ptr<mavsdk::System> system) {
    system_    = std::move(system);
    telemetry_ = std::make_unique<mavsdk::Telemetry>(system_);

    std::cout << "[MAVSDK] Autopilot discovered (system " << int(system_->get_system_id())
              << ")\n";

    connected_handle_ = system_->subscribe_is_connected([this](bool connected) {
        dispatch([this, connected]() { notify_state(connected); });
    });

    // Handlers registered before discovery.
    if (on_position_) wire_position();
    if (on_attitude_) wire_attitude();
    if (on_battery_)  wire_battery();

    if (system_->is_connected()) notify_state(true);
}

void MavsdkSource::notify_state(bool connected) {
    if (!connected) std::cerr << "[MAVSDK] Heartbeat lost\n";
    ConnectionState s;
    s.is_connected = connected;
    if (on_state_) on_state_(s);
}

void MavsdkSource::subscribe_connection_state(ConnectionHandler handler) {
    on_state_ = std::move(handler);
}

void MavsdkSource::async_set_rate(RateMetric metric, double hz, RateHandler handler) {
    if (!telemetry_ || !system_->is_connected()) {
        asio::post(ioc_, [handler]() { handler(make_error_code(SourceErrc::not_connected)); });
        return;
    }

    auto done = [this, handler](mavsdk::Telemetry::Result r) {
        dispatch([handler, r]() { handler(to_error_code(r)); });
    };

    switch (metric) {
        case RateMetric::Position:    telemetry_->set_rate_position_async(hz, done);       break;
        case RateMetric::Battery:     telemetry_->set_rate_battery_async(hz, done);        break;
        case RateMetric::Attitude:    telemetry_->set_rate_attitude_euler_async(hz, done); break;
        case RateMetric::VelocityNed: telemetry_->set_rate_velocity_ned_async(hz, done);   break;
        case RateMetric::GpsInfo:     telemetry_->set_rate_gps_info_async(hz, done);       break;
        case RateMetric::Home:        telemetry_->set_rate_home_async(hz, done);           break;
        case RateMetric::InAir:       telemetry_->set_rate_in_air_async(hz, done);         break;
        case RateMetric::LandedState: telemetry_->set_rate_landed_state_async(hz, done);   break;
    }
}

// ---------------------------------------------------------------------------
// Value streams
// ---------------------------------------------------------------------------
void MavsdkSource::subscribe_position(PositionHandler handler) {
    on_position_ = std::move(handler);
    if (telemetry_ && !position_handle_) wire_position();
}

void MavsdkSource::subscribe_attitude(AttitudeHandler handler) {
    on_attitude_ = std::move(handler);
    if (telemetry_ && !attitude_handle_) wire_attitude();
}

void MavsdkSource::subscribe_battery(BatteryHandler handler) {
    on_battery_ = std::move(handler);
    if (telemetry_ && !battery_handle_) wire_battery();
}

void MavsdkSource::subscribe_fault(FaultHandler handler) {
    on_fault_ = std::move(handler);
}

void MavsdkSource::wire_position() {
    position_handle_ = telemetry_->subscribe_position([this](mavsdk::Telemetry::Position p) {
        PositionSample s;
        s.latitude_deg        = p.latitude_deg;
        s.longitude_deg       = p.longitude_deg;
        s.absolute_altitude_m = p.absolute_altitude_m;
        s.relative_altitude_m = p.relative_altitude_m;
        dispatch([this, s]() {
            if (on_position_) on_position_(s);
        });
    });
}

void MavsdkSource::wire_attitude() {
    attitude_handle_ = telemetry_->subscribe_attitude_euler(
        [this](mavsdk::Telemetry::EulerAngle a) {
            AttitudeSample s;
            s.roll_deg  = a.roll_deg;
            s.pitch_deg = a.pitch_deg;
            s.yaw_deg   = a.yaw_deg;
            dispatch([this, s]() {
                if (on_attitude_) on_attitude_(s);
            });
        });
}

void MavsdkSource::wire_battery() {
    battery_handle_ = telemetry_->subscribe_battery([this](mavsdk::Telemetry::Battery b) {
        BatterySample s;
        s.voltage_v = b.voltage_v;
        // MAVSDK reports 0..100; NaN (unknown) passes through.
        s.remaining_percent = b.remaining_percent / 100.0;
        dispatch([this, s]() {
            if (on_battery_) on_battery_(s);
        });
    });
}

// ---------------------------------------------------------------------------
// Teardown
// ---------------------------------------------------------------------------
void MavsdkSource::close() {
    if (!alive_->exchange(false)) return;  // already closed
    release_link();
}

void MavsdkSource::release_link() {
    if (telemetry_) {
        if (position_handle_) telemetry_->unsubscribe_position(*position_handle_);
        if (attitude_handle_) telemetry_->unsubscribe_attitude_euler(*attitude_handle_);
        if (battery_handle_)  telemetry_->unsubscribe_battery(*battery_handle_);
    }
    if (system_ && connected_handle_) system_->unsubscribe_is_connected(*connected_handle_);
    if (mavsdk_) {
        if (new_system_handle_) mavsdk_->unsubscribe_on_new_system(*new_system_handle_);
        if (error_handle_)      mavsdk_->unsubscribe_connection_errors(*error_handle_);
    }

    position_handle_.reset();
    attitude_handle_.reset();
    battery_handle_.reset();
    connected_handle_.reset();
    new_system_handle_.reset();
    error_handle_.reset();

    // Destroying the Mavsdk instance joins its threads; no callback can
    // touch this object afterwards.
    telemetry_.reset();
    system_.reset();
    mavsdk_.reset();
}
