#include "telemetry/TelemetryState.hpp"
#include <cmath>

using namespace helios;
using json = nlohmann::json;

// null for "never written" and for non-finite values (unknown readings).
static json nullable(const std::optional<double>& v) {
    if (!v || !std::isfinite(*v)) return nullptr;
    return *v;
}

static json nullable(const std::optional<std::string>& v) {
    if (!v) return nullptr;
    return *v;
}

void helios::to_json(json& j, const PositionGroup& g) {
    j = json{
        {"latitude_deg",        nullable(g.latitude_deg)},
        {"longitude_deg",       nullable(g.longitude_deg)},
        {"absolute_altitude_m", nullable(g.absolute_altitude_m)},
        {"relative_altitude_m", nullable(g.relative_altitude_m)},
    };
}

void helios::to_json(json& j, const AttitudeGroup& g) {
    j = json{
        {"roll_deg",  nullable(g.roll_deg)},
        {"pitch_deg", nullable(g.pitch_deg)},
        {"yaw_deg",   nullable(g.yaw_deg)},
    };
}

void helios::to_json(json& j, const BatteryGroup& g) {
    j = json{
        {"voltage_v",         nullable(g.voltage_v)},
        {"remaining_percent", nullable(g.remaining_percent)},
    };
}

void helios::to_json(json& j, const TelemetryState& s) {
    j = json::object();
    j[group::CONNECTED]    = s.connected;
    j[group::CONNECTING]   = s.connecting;
    j[group::STARTED_AT]   = nullable(s.started_at);
    j[group::POSITION]     = s.position;
    j[group::ATTITUDE]     = s.attitude;
    j[group::BATTERY]      = s.battery;
    j[group::LAST_UPDATED] = nullable(s.last_updated);
    j[group::FAULT]        = nullable(s.fault);
}

void TelemetryStore::patch(const TelemetryPatch& p) {
    auto now = WallClock::now();

    std::lock_guard<std::mutex> lock(mtx_);

    if (p.connected)  state_.connected  = *p.connected;
    if (p.connecting) state_.connecting = *p.connecting;
    if (p.started_at) state_.started_at = *p.started_at;
    if (p.position)   state_.position   = *p.position;
    if (p.attitude)   state_.attitude   = *p.attitude;
    if (p.battery)    state_.battery    = *p.battery;
    if (p.fault)      state_.fault      = *p.fault;

    // Wall clock may step backwards (NTP); last_updated must not.
    if (now < last_stamp_) now = last_stamp_;
    last_stamp_ = now;
    state_.last_updated = iso_utc(now);
}

TelemetryState TelemetryStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

json TelemetryStore::get(const std::vector<std::string>& groups) const {
    TelemetryState copy = snapshot();

    json full = copy;
    if (groups.empty()) return full;

    json out = json::object();
    for (const auto& name : groups) {
        auto it = full.find(name);
        if (it != full.end()) out[name] = *it;
    }
    return out;
}
