#pragma once
#include <string>
#include <vector>

namespace helios {

// ---------------------------------------------------------------------------
// Per-session group filter for the live stream.
//
// Starts unrestricted. A control message {"subscribe": [...]} either resets
// to unrestricted (list contains "all") or narrows to the listed groups that
// are valid. An empty narrowed set is legal: the session then receives only
// last_updated until the client subscribes again.
// ---------------------------------------------------------------------------
class SubscriptionFilter {
public:
    // Valid groups, in wire order.
    static const std::vector<std::string>& all_groups();

    // Applies one inbound text message. Returns true when the message was a
    // usable subscribe request; anything else leaves the filter unchanged.
    bool apply(const std::string& message);

    bool unrestricted() const { return unrestricted_; }

    // Groups to send this tick.
    const std::vector<std::string>& selected() const;

    std::string describe() const;

private:
    bool unrestricted_{true};
    std::vector<std::string> groups_;
};

} // namespace helios
