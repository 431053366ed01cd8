#include "telemetry/SubscriptionFilter.hpp"
#include "telemetry/TelemetryState.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

using namespace helios;
using json = nlohmann::json;

const std::vector<std::string>& SubscriptionFilter::all_groups() {
    static const std::vector<std::string> groups = {
        group::POSITION, group::ATTITUDE, group::BATTERY,
    };
    return groups;
}

bool SubscriptionFilter::apply(const std::string& message) {
    json payload = json::parse(message, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) return false;

    // No "subscribe" key means "all".
    auto it = payload.find("subscribe");
    if (it == payload.end()) {
        unrestricted_ = true;
        groups_.clear();
        return true;
    }
    if (!it->is_array()) return false;

    std::vector<std::string> requested;
    for (const auto& entry : *it) {
        if (!entry.is_string()) continue;
        requested.push_back(entry.get<std::string>());
    }

    if (std::find(requested.begin(), requested.end(), "all") != requested.end()) {
        unrestricted_ = true;
        groups_.clear();
        return true;
    }

    // Keep wire order, drop unknown names and duplicates.
    std::vector<std::string> narrowed;
    for (const auto& name : all_groups()) {
        if (std::find(requested.begin(), requested.end(), name) != requested.end())
            narrowed.push_back(name);
    }

    unrestricted_ = false;
    groups_ = std::move(narrowed);
    return true;
}

const std::vector<std::string>& SubscriptionFilter::selected() const {
    return unrestricted_ ? all_groups() : groups_;
}

std::string SubscriptionFilter::describe() const {
    if (unrestricted_) return "all";
    if (groups_.empty()) return "(none)";

    std::string out;
    for (const auto& g : groups_) {
        if (!out.empty()) out += ",";
        out += g;
    }
    return out;
}
