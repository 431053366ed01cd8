#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>

#include "telemetry/SnapshotReader.hpp"

namespace helios {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Backend {
    Mavlink,   // push-stream autopilot link
    Dji,       // line-delimited JSON bridge on a Unix socket
};

const char* to_string(Backend b);

// Accepts "mavlink"/"mavsdk" and "dji"/"socket", any case.
Backend parse_backend(const std::string& name);

// ---------------------------------------------------------------------------
// Service configuration, read once at startup.
//
// Values come from the process environment. load_dotenv() can seed the
// environment from a KEY=VALUE file first; variables already set win.
//
//   DRONE_TYPE            mavlink | dji                 (mavlink)
//   DRONE_ADDRESS         stream source address         (udpin://0.0.0.0:14551)
//   DJI_SOCK_PATH         bridge socket path            (/tmp/helios-dji-telemetry.sock)
//   DJI_RECONNECT_S       bridge reconnect backoff      (2)
//   SOCKET_READ_TIMEOUT_S bridge read timeout           (5)
//   CONNECT_TIMEOUT       stream connect timeout, s     (30)
//   TELEM_RATE_HZ         requested telemetry rate      (2)
//   WS_RATE_HZ            live stream push rate         (10)
//   HTTP_HOST / HTTP_PORT listen address                (0.0.0.0:5000)
// ---------------------------------------------------------------------------
struct ServiceConfig {
    using Lookup = std::function<const char*(const char*)>;

    static const char* process_env(const char* key);

    Backend     backend{Backend::Mavlink};
    std::string drone_address{"udpin://0.0.0.0:14551"};
    std::string socket_path{"/tmp/helios-dji-telemetry.sock"};

    std::chrono::milliseconds socket_reconnect_backoff{2000};
    std::chrono::milliseconds socket_read_timeout{5000};
    std::chrono::milliseconds connect_timeout{30000};

    double telemetry_rate_hz{2.0};
    double push_rate_hz{10.0};

    std::string http_host{"0.0.0.0"};
    uint16_t    http_port{5000};

    // Throws ConfigError on malformed or out-of-range values.
    static ServiceConfig from_env(const Lookup& lookup = process_env);

    // Address of whichever source the selected backend reads.
    const std::string& source_address() const;

    std::chrono::microseconds push_interval() const;

    void dump(std::ostream& out) const;
};

StatusInfo status_info(const ServiceConfig& cfg);

// Sets KEY=VALUE pairs from `path` into the environment without overriding
// existing variables. Returns false when the file cannot be opened.
bool load_dotenv(const std::string& path);

} // namespace helios
