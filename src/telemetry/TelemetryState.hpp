#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "telemetry/Timestamp.hpp"

namespace helios {

// Top-level group names as they appear on the wire.
namespace group {
constexpr const char* POSITION     = "position";
constexpr const char* ATTITUDE     = "attitude";
constexpr const char* BATTERY      = "battery";
constexpr const char* CONNECTED    = "connected";
constexpr const char* CONNECTING   = "connecting";
constexpr const char* STARTED_AT   = "started_at";
constexpr const char* LAST_UPDATED = "last_updated";
constexpr const char* FAULT        = "fault";
}

// Every value is optional: "no data yet" is null on the wire, never 0.
struct PositionGroup {
    std::optional<double> latitude_deg;
    std::optional<double> longitude_deg;
    std::optional<double> absolute_altitude_m;
    std::optional<double> relative_altitude_m;
};

struct AttitudeGroup {
    std::optional<double> roll_deg;
    std::optional<double> pitch_deg;
    std::optional<double> yaw_deg;
};

struct BatteryGroup {
    std::optional<double> voltage_v;
    std::optional<double> remaining_percent;   // 0..1 fraction
};

struct TelemetryState {
    bool connected{false};
    bool connecting{false};
    std::optional<std::string> started_at;

    PositionGroup position;
    AttitudeGroup attitude;
    BatteryGroup  battery;

    std::optional<std::string> last_updated;

    // Set once when a stream ingestion adapter dies after connecting.
    std::optional<std::string> fault;
};

// ---------------------------------------------------------------------------
// Group-level partial update. Engaged members replace the whole group (or
// the single status field); disengaged members leave the store untouched.
// There is no merge inside a group.
// ---------------------------------------------------------------------------
struct TelemetryPatch {
    std::optional<bool>          connected;
    std::optional<bool>          connecting;
    std::optional<std::string>   started_at;
    std::optional<PositionGroup> position;
    std::optional<AttitudeGroup> attitude;
    std::optional<BatteryGroup>  battery;
    std::optional<std::string>   fault;

    bool empty() const {
        return !connected && !connecting && !started_at &&
               !position && !attitude && !battery && !fault;
    }
};

void to_json(nlohmann::json& j, const PositionGroup& g);
void to_json(nlohmann::json& j, const AttitudeGroup& g);
void to_json(nlohmann::json& j, const BatteryGroup& g);
void to_json(nlohmann::json& j, const TelemetryState& s);

// ---------------------------------------------------------------------------
// TelemetryStore - the single latest-value store.
//
// One mutex guards the whole state. patch() applies every engaged group of
// one call plus the last_updated stamp under a single lock, so readers see
// all of a patch or none of it. Critical sections copy a handful of fields
// and never do I/O; JSON building happens after the lock is released.
//
// Only the active ingestion adapter calls patch(). Everything else reads.
// ---------------------------------------------------------------------------
class TelemetryStore {
public:
    void patch(const TelemetryPatch& p);

    // Deep copy of the whole state.
    TelemetryState snapshot() const;

    // Copy of the named top-level groups, or everything when `groups` is
    // empty. Unknown names are skipped.
    nlohmann::json get(const std::vector<std::string>& groups = {}) const;

private:
    mutable std::mutex mtx_;
    TelemetryState     state_;
    WallClock::time_point last_stamp_{};
};

} // namespace helios
