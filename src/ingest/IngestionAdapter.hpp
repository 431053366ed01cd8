#pragma once

namespace helios {

class TelemetryStore;

// ---------------------------------------------------------------------------
// Ingestion adapter - the single writer of the TelemetryStore.
//
// Exactly one adapter is active per process, chosen from configuration at
// startup. start() returns immediately; the adapter runs on its own worker
// until stop() or, for adapters with a terminal state, until it gives up.
// The store must outlive the adapter.
// ---------------------------------------------------------------------------
class IngestionAdapter {
public:
    virtual ~IngestionAdapter() = default;

    virtual void start(TelemetryStore& store) = 0;
    virtual void stop() = 0;

    virtual const char* name() const = 0;
};

} // namespace helios
