#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "telemetry/TelemetryState.hpp"

namespace helios {

// ---------------------------------------------------------------------------
// Newline framing for the socket bridge.
//
// feed() appends raw bytes and returns every complete line, trimmed, with
// blank lines removed. A trailing partial line stays buffered until its
// newline arrives. A peer that never sends a newline cannot grow the buffer
// past MAX_PENDING; the partial line is discarded instead.
// ---------------------------------------------------------------------------
class LineBuffer {
public:
    static constexpr std::size_t MAX_PENDING = 1 << 20;

    std::vector<std::string> feed(const char* data, std::size_t len);
    void clear() { buf_.clear(); }
    std::size_t pending() const { return buf_.size(); }
    std::size_t overflows() const { return overflows_; }

private:
    std::string buf_;
    std::size_t overflows_{0};
};

// Turns one bridge line into a store patch.
//
// {"position": {...}, "attitude": {...}, "battery": {...}}
//
// Any subset of groups may be present. A group counts only when it is a
// non-empty object; missing or non-numeric fields inside it become null.
// Returns nullopt for lines that are not JSON objects or carry no group.
std::optional<TelemetryPatch> decode_frame(const std::string& line);

} // namespace helios
