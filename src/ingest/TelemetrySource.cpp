#include "ingest/TelemetrySource.hpp"

using namespace helios;

const char* helios::to_string(RateMetric m) {
    switch (m) {
        case RateMetric::Position:    return "position";
        case RateMetric::Battery:     return "battery";
        case RateMetric::Attitude:    return "attitude";
        case RateMetric::VelocityNed: return "velocity_ned";
        case RateMetric::GpsInfo:     return "gps_info";
        case RateMetric::Home:        return "home";
        case RateMetric::InAir:       return "in_air";
        case RateMetric::LandedState: return "landed_state";
    }
    return "unknown";
}

namespace {

class SourceCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "helios.source"; }

    std::string message(int ev) const override {
        switch (static_cast<SourceErrc>(ev)) {
            case SourceErrc::rate_rejected: return "rate request rejected by autopilot";
            case SourceErrc::rate_timeout:  return "no acknowledgement for rate request";
            case SourceErrc::not_connected: return "link not connected";
            case SourceErrc::link_closed:   return "link closed";
        }
        return "unknown source error";
    }
};

}

const boost::system::error_category& helios::source_category() {
    static const SourceCategory category;
    return category;
}

boost::system::error_code helios::make_error_code(SourceErrc e) {
    return boost::system::error_code(static_cast<int>(e), source_category());
}
