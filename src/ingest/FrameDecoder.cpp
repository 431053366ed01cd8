#include "ingest/FrameDecoder.hpp"
#include <nlohmann/json.hpp>

using namespace helios;
using json = nlohmann::json;

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> LineBuffer::feed(const char* data, std::size_t len) {
    buf_.append(data, len);

    std::vector<std::string> lines;
    size_t start = 0;
    size_t nl;
    while ((nl = buf_.find('\n', start)) != std::string::npos) {
        std::string line = trim(buf_.substr(start, nl - start));
        if (!line.empty()) lines.push_back(std::move(line));
        start = nl + 1;
    }
    buf_.erase(0, start);

    if (buf_.size() > MAX_PENDING) {
        buf_.clear();
        overflows_++;
    }
    return lines;
}

static std::optional<double> number_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

// The group object, if the frame carries it as a non-empty object.
static const json* group_object(const json& frame, const char* key) {
    auto it = frame.find(key);
    if (it == frame.end() || !it->is_object() || it->empty()) return nullptr;
    return &(*it);
}

std::optional<TelemetryPatch> helios::decode_frame(const std::string& line) {
    json frame = json::parse(line, nullptr, false);
    if (frame.is_discarded() || !frame.is_object()) return std::nullopt;

    TelemetryPatch p;

    if (const json* pos = group_object(frame, group::POSITION)) {
        PositionGroup g;
        g.latitude_deg        = number_field(*pos, "latitude_deg");
        g.longitude_deg       = number_field(*pos, "longitude_deg");
        g.absolute_altitude_m = number_field(*pos, "absolute_altitude_m");
        g.relative_altitude_m = number_field(*pos, "relative_altitude_m");
        p.position = g;
    }

    if (const json* att = group_object(frame, group::ATTITUDE)) {
        AttitudeGroup g;
        g.roll_deg  = number_field(*att, "roll_deg");
        g.pitch_deg = number_field(*att, "pitch_deg");
        g.yaw_deg   = number_field(*att, "yaw_deg");
        p.attitude = g;
    }

    if (const json* bat = group_object(frame, group::BATTERY)) {
        BatteryGroup g;
        g.voltage_v         = number_field(*bat, "voltage_v");
        g.remaining_percent = number_field(*bat, "remaining_percent");
        p.battery = g;
    }

    if (p.empty()) return std::nullopt;
    return p;
}
