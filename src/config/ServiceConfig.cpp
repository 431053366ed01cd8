#include "config/ServiceConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>

using namespace helios;

const char* helios::to_string(Backend b) {
    switch (b) {
        case Backend::Mavlink: return "mavlink";
        case Backend::Dji:     return "dji";
    }
    return "unknown";
}

Backend helios::parse_backend(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "mavlink" || lower == "mavsdk") return Backend::Mavlink;
    if (lower == "dji" || lower == "socket")     return Backend::Dji;
    throw ConfigError("DRONE_TYPE: unknown backend '" + name + "' (expected mavlink or dji)");
}

// ---------------------------------------------------------------------------
// Environment helpers
// ---------------------------------------------------------------------------
static std::string env_string(const ServiceConfig::Lookup& lookup, const char* key,
                              const std::string& def) {
    const char* v = lookup(key);
    if (!v || !*v) return def;
    return v;
}

static double env_number(const ServiceConfig::Lookup& lookup, const char* key, double def) {
    const char* v = lookup(key);
    if (!v || !*v) return def;

    std::string s(v);
    size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(s, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(key) + ": expected a number, got '" + s + "'");
    }
    while (used < s.size() && std::isspace(static_cast<unsigned char>(s[used]))) used++;
    if (used != s.size() || !std::isfinite(out))
        throw ConfigError(std::string(key) + ": expected a number, got '" + s + "'");
    return out;
}

static double env_positive(const ServiceConfig::Lookup& lookup, const char* key, double def) {
    double v = env_number(lookup, key, def);
    if (v <= 0.0) throw ConfigError(std::string(key) + ": must be positive");
    return v;
}

static std::chrono::milliseconds seconds_to_ms(double s) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(s * 1000.0)));
}

const char* ServiceConfig::process_env(const char* key) {
    return std::getenv(key);
}

ServiceConfig ServiceConfig::from_env(const Lookup& lookup) {
    ServiceConfig cfg;

    cfg.backend       = parse_backend(env_string(lookup, "DRONE_TYPE", to_string(cfg.backend)));
    cfg.drone_address = env_string(lookup, "DRONE_ADDRESS", cfg.drone_address);
    cfg.socket_path   = env_string(lookup, "DJI_SOCK_PATH", cfg.socket_path);

    cfg.socket_reconnect_backoff = seconds_to_ms(env_positive(lookup, "DJI_RECONNECT_S", 2.0));
    cfg.socket_read_timeout      = seconds_to_ms(env_positive(lookup, "SOCKET_READ_TIMEOUT_S", 5.0));
    cfg.connect_timeout          = seconds_to_ms(env_positive(lookup, "CONNECT_TIMEOUT", 30.0));

    cfg.telemetry_rate_hz = env_positive(lookup, "TELEM_RATE_HZ", cfg.telemetry_rate_hz);
    cfg.push_rate_hz      = env_positive(lookup, "WS_RATE_HZ", cfg.push_rate_hz);

    cfg.http_host = env_string(lookup, "HTTP_HOST", cfg.http_host);

    double port = env_number(lookup, "HTTP_PORT", cfg.http_port);
    if (port < 1 || port > 65535 || std::floor(port) != port)
        throw ConfigError("HTTP_PORT: must be an integer in 1..65535");
    cfg.http_port = static_cast<uint16_t>(port);

    return cfg;
}

const std::string& ServiceConfig::source_address() const {
    return backend == Backend::Dji ? socket_path : drone_address;
}

std::chrono::microseconds ServiceConfig::push_interval() const {
    return std::chrono::microseconds(static_cast<int64_t>(std::llround(1e6 / push_rate_hz)));
}

void ServiceConfig::dump(std::ostream& out) const {
    out << "[CONFIG] backend=" << to_string(backend)
        << " source=" << source_address() << "\n";
    if (backend == Backend::Dji) {
        out << "[CONFIG] reconnect_backoff=" << socket_reconnect_backoff.count() << "ms"
            << " read_timeout=" << socket_read_timeout.count() << "ms\n";
    } else {
        out << "[CONFIG] connect_timeout=" << connect_timeout.count() << "ms"
            << " telemetry_rate=" << telemetry_rate_hz << "Hz\n";
    }
    out << "[CONFIG] http=" << http_host << ":" << http_port
        << " push_rate=" << push_rate_hz << "Hz\n";
}

StatusInfo helios::status_info(const ServiceConfig& cfg) {
    StatusInfo info;
    info.backend        = to_string(cfg.backend);
    info.source_address = cfg.source_address();
    info.push_rate_hz   = cfg.push_rate_hz;
    return info;
}

// ---------------------------------------------------------------------------
// .env loader. Skips blank lines and # comments, accepts an "export "
// prefix, strips matching quotes around values.
// ---------------------------------------------------------------------------
bool helios::load_dotenv(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return false;

    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') continue;
        line = line.substr(first);

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        if (key.compare(0, 7, "export ") == 0) key = key.substr(7);
        while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
        if (key.empty()) continue;

        size_t vs = value.find_first_not_of(" \t");
        value = (vs == std::string::npos) ? "" : value.substr(vs);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();

        if (value.size() >= 2) {
            char q = value.front();
            if ((q == '"' || q == '\'') && value.back() == q)
                value = value.substr(1, value.size() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0);
    }

    std::cout << "[CONFIG] .env loaded from " << path << "\n";
    return true;
}
