#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <mavsdk/mavsdk.h>
#include <mavsdk/plugins/telemetry/telemetry.h>

#include "ingest/TelemetrySource.hpp"

namespace helios {

// ---------------------------------------------------------------------------
// TelemetrySource backed by MAVSDK.
//
// MAVSDK delivers its callbacks on its own threads. Every one of them is
// re-posted onto the io_context given at construction, so the handlers
// registered here run on that io_context only. Not thread-safe otherwise;
// call it from that io_context (or after it stopped).
//
// The first component that reports an autopilot becomes the vehicle.
// Connection-state notifications follow MAVSDK's heartbeat tracking.
// ---------------------------------------------------------------------------
class MavsdkSource : public TelemetrySource {
public:
    explicit MavsdkSource(boost::asio::io_context& ioc);
    ~MavsdkSource() override;

    // Accepts any MAVSDK connection URL (udpin://, udpout://, serial://, ...).
    void connect(const std::string& address) override;
    void subscribe_connection_state(ConnectionHandler handler) override;
    void async_set_rate(RateMetric metric, double hz, RateHandler handler) override;
    void subscribe_position(PositionHandler handler) override;
    void subscribe_attitude(AttitudeHandler handler) override;
    void subscribe_battery(BatteryHandler handler) override;
    void subscribe_fault(FaultHandler handler) override;
    void close() override;

    bool has_vehicle() const { return static_cast<bool>(telemetry_); }

private:
    // Runs `fn` on ioc_ unless the source was closed in between.
    template <typename Fn>
    void dispatch(Fn&& fn);

    void on_new_system();
    void attach(std::shared_ptr<mavsdk::System> system);
    void notify_state(bool connected);

    void wire_position();
    void wire_attitude();
    void wire_battery();

    void release_link();

    boost::asio::io_context&           ioc_;
    std::shared_ptr<std::atomic<bool>> alive_;

    std::unique_ptr<mavsdk::Mavsdk>    mavsdk_;
    std::shared_ptr<mavsdk::System>    system_;
    std::unique_ptr<mavsdk::Telemetry> telemetry_;

    std::optional<mavsdk::Mavsdk::NewSystemHandle>       new_system_handle_;
    std::optional<mavsdk::Mavsdk::ConnectionErrorHandle> error_handle_;
    std::optional<mavsdk::System::IsConnectedHandle>     connected_handle_;
    std::optional<mavsdk::Telemetry::PositionHandle>     position_handle_;
    std::optional<mavsdk::Telemetry::AttitudeEulerHandle> attitude_handle_;
    std::optional<mavsdk::Telemetry::BatteryHandle>      battery_handle_;

    ConnectionHandler on_state_;
    PositionHandler   on_position_;
    AttitudeHandler   on_attitude_;
    BatteryHandler    on_battery_;
    FaultHandler      on_fault_;
};

} // namespace helios
