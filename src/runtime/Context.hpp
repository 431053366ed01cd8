#pragma once

#include <atomic>
#include <utility>

#include "config/ServiceConfig.hpp"
#include "telemetry/TelemetryState.hpp"
#include "telemetry/SnapshotReader.hpp"

namespace helios {

// Single owner of the service state. Constructed once in main() from the
// loaded configuration; every component receives a reference to it.
// The ingestion adapter writes `telemetry`; the HTTP side reads it through
// `reader`. Clearing `running` winds the HTTP server down.
struct Context {
    std::atomic<bool> running{true};

    const ServiceConfig config;

    TelemetryStore telemetry;
    SnapshotReader reader;

    explicit Context(ServiceConfig cfg)
        : config(std::move(cfg)),
          reader(telemetry, status_info(config)) {}
};

} // namespace helios
