#pragma once
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

namespace helios {

// ---------------------------------------------------------------------------
// Push-style telemetry source (autopilot link).
//
// A source is bound to one io_context at construction and invokes every
// handler on that io_context. The stream ingestion adapter runs that
// io_context on its own worker, so handlers never race each other.
//
// Values arrive in SI-ish units: degrees, metres, volts, 0..1 fraction.
// ---------------------------------------------------------------------------

struct ConnectionState {
    bool is_connected{false};
};

struct PositionSample {
    double latitude_deg{0.0};
    double longitude_deg{0.0};
    double absolute_altitude_m{0.0};
    double relative_altitude_m{0.0};
};

struct AttitudeSample {
    double roll_deg{0.0};
    double pitch_deg{0.0};
    double yaw_deg{0.0};
};

struct BatterySample {
    double voltage_v{0.0};
    double remaining_percent{0.0};   // NaN when the autopilot does not know
};

enum class RateMetric {
    Position,
    Battery,
    Attitude,
    VelocityNed,
    GpsInfo,
    Home,
    InAir,
    LandedState,
};

const char* to_string(RateMetric m);

// Thrown by connect() for addresses the source cannot open.
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SourceErrc {
    rate_rejected = 1,
    rate_timeout,
    not_connected,
    link_closed,
};

const boost::system::error_category& source_category();
boost::system::error_code make_error_code(SourceErrc e);

class TelemetrySource {
public:
    using ConnectionHandler = std::function<void(const ConnectionState&)>;
    using RateHandler       = std::function<void(const boost::system::error_code&)>;
    using PositionHandler   = std::function<void(const PositionSample&)>;
    using AttitudeHandler   = std::function<void(const AttitudeSample&)>;
    using BatteryHandler    = std::function<void(const BatterySample&)>;
    using FaultHandler      = std::function<void(const std::string&)>;

    virtual ~TelemetrySource() = default;

    // Opens the link. Throws SourceError on a malformed or unopenable address.
    virtual void connect(const std::string& address) = 0;

    // Repeating notification; fires on every link heartbeat and on loss.
    virtual void subscribe_connection_state(ConnectionHandler handler) = 0;

    // Best-effort. Handler receives an empty error_code on acknowledgement.
    virtual void async_set_rate(RateMetric metric, double hz, RateHandler handler) = 0;

    virtual void subscribe_position(PositionHandler handler) = 0;
    virtual void subscribe_attitude(AttitudeHandler handler) = 0;
    virtual void subscribe_battery(BatteryHandler handler) = 0;

    // Unrecoverable link failure after connect().
    virtual void subscribe_fault(FaultHandler handler) = 0;

    virtual void close() = 0;
};

using SourceFactory =
    std::function<std::unique_ptr<TelemetrySource>(boost::asio::io_context&)>;

} // namespace helios

namespace boost {
namespace system {
template <>
struct is_error_code_enum<helios::SourceErrc> : std::true_type {};
}
}
