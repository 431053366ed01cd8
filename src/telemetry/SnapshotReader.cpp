#include "telemetry/SnapshotReader.hpp"
#include "telemetry/SubscriptionFilter.hpp"
#include "telemetry/TelemetryState.hpp"

using namespace helios;
using json = nlohmann::json;

SnapshotReader::SnapshotReader(const TelemetryStore& store, StatusInfo info)
    : store_(store), info_(std::move(info)) {}

json SnapshotReader::full() const {
    return store_.get({group::POSITION, group::ATTITUDE, group::BATTERY, group::LAST_UPDATED});
}

json SnapshotReader::position() const {
    return store_.get({group::POSITION});
}

json SnapshotReader::attitude() const {
    return store_.get({group::ATTITUDE});
}

json SnapshotReader::battery() const {
    return store_.get({group::BATTERY});
}

json SnapshotReader::status() const {
    json out = store_.get({group::CONNECTED, group::CONNECTING, group::STARTED_AT,
                           group::LAST_UPDATED, group::FAULT});
    out["backend"]        = info_.backend;
    out["source_address"] = info_.source_address;
    out["push_rate_hz"]   = info_.push_rate_hz;
    return out;
}

json SnapshotReader::stream_frame(const SubscriptionFilter& filter) const {
    std::vector<std::string> groups = filter.selected();
    groups.push_back(group::LAST_UPDATED);
    return store_.get(groups);
}
