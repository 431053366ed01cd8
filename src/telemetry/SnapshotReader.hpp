#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace helios {

class TelemetryStore;
class SubscriptionFilter;

// Static service facts reported by /status. Fixed at startup.
struct StatusInfo {
    std::string backend;
    std::string source_address;
    double push_rate_hz{10.0};
};

// ---------------------------------------------------------------------------
// Point-in-time queries over the store. Stateless apart from the static
// StatusInfo; safe to call from any number of request threads.
// ---------------------------------------------------------------------------
class SnapshotReader {
public:
    SnapshotReader(const TelemetryStore& store, StatusInfo info);

    // {position, attitude, battery, last_updated}
    nlohmann::json full() const;

    nlohmann::json position() const;
    nlohmann::json attitude() const;
    nlohmann::json battery() const;

    // Live connection flags merged with the static StatusInfo.
    nlohmann::json status() const;

    // One live-stream frame: the filter's groups plus last_updated.
    nlohmann::json stream_frame(const SubscriptionFilter& filter) const;

    const StatusInfo& info() const { return info_; }

private:
    const TelemetryStore& store_;
    StatusInfo info_;
};

} // namespace helios
