#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "config/ServiceConfig.hpp"
#include "ingest/IngestionAdapter.hpp"
#include "ingest/SocketLineIngestionAdapter.hpp"
#include "ingest/StreamIngestionAdapter.hpp"
#include "mavsdk/MavsdkSource.hpp"
#include "runtime/Context.hpp"
#include "telemetry/HttpServer.hpp"

using namespace helios;

static std::atomic<bool> g_running{true};
static void on_signal(int) { g_running.store(false); }

static void load_env_file() {
    if (const char* explicit_path = std::getenv("HELIOS_ENV_FILE")) {
        if (!load_dotenv(explicit_path))
            std::cerr << "[CONFIG] HELIOS_ENV_FILE=" << explicit_path << " not readable\n";
        return;
    }
    if (load_dotenv(".env")) return;
    load_dotenv("../.env");
}

static std::unique_ptr<IngestionAdapter> make_adapter(const ServiceConfig& cfg) {
    if (cfg.backend == Backend::Dji) {
        SocketAdapterOptions opts;
        opts.socket_path       = cfg.socket_path;
        opts.reconnect_backoff = cfg.socket_reconnect_backoff;
        opts.read_timeout      = cfg.socket_read_timeout;
        return std::make_unique<SocketLineIngestionAdapter>(opts);
    }

    StreamAdapterOptions opts;
    opts.address           = cfg.drone_address;
    opts.connect_timeout   = cfg.connect_timeout;
    opts.telemetry_rate_hz = cfg.telemetry_rate_hz;
    return std::make_unique<StreamIngestionAdapter>(opts,
        [](boost::asio::io_context& ioc) -> std::unique_ptr<TelemetrySource> {
            return std::make_unique<MavsdkSource>(ioc);
        });
}

int main() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "[HELIOS] Telemetry service starting\n";

    load_env_file();

    ServiceConfig cfg;
    try {
        cfg = ServiceConfig::from_env();
    } catch (const ConfigError& e) {
        std::cerr << "[CONFIG] " << e.what() << "\n";
        return 1;
    }
    cfg.dump(std::cout);

    Context ctx(cfg);

    std::unique_ptr<IngestionAdapter> adapter = make_adapter(ctx.config);
    HttpServer server(ctx);

    adapter->start(ctx.telemetry);
    std::cout << "[HELIOS] Ingestion adapter '" << adapter->name() << "' started\n";

    try {
        server.start();
    } catch (const boost::system::system_error& e) {
        std::cerr << "[HTTP] Cannot listen on " << ctx.config.http_host << ":"
                  << ctx.config.http_port << ": " << e.what() << "\n";
        adapter->stop();
        return 1;
    }

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[HELIOS] Shutting down\n";
    ctx.running.store(false);
    server.stop();
    adapter->stop();
    std::cout << "[HELIOS] Stopped\n";
    return 0;
}
