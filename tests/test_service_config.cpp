#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

#include "config/ServiceConfig.hpp"

using namespace helios;

namespace {

// Environment stand-in for from_env().
struct FakeEnv {
    std::map<std::string, std::string> vars;

    ServiceConfig::Lookup lookup() const {
        return [this](const char* key) -> const char* {
            auto it = vars.find(key);
            return it == vars.end() ? nullptr : it->second.c_str();
        };
    }
};

}

TEST(ServiceConfig, Defaults) {
    FakeEnv env;
    ServiceConfig cfg = ServiceConfig::from_env(env.lookup());

    EXPECT_EQ(cfg.backend, Backend::Mavlink);
    EXPECT_EQ(cfg.drone_address, "udpin://0.0.0.0:14551");
    EXPECT_EQ(cfg.socket_path, "/tmp/helios-dji-telemetry.sock");
    EXPECT_EQ(cfg.socket_reconnect_backoff, std::chrono::milliseconds(2000));
    EXPECT_EQ(cfg.socket_read_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.connect_timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(cfg.telemetry_rate_hz, 2.0);
    EXPECT_EQ(cfg.push_rate_hz, 10.0);
    EXPECT_EQ(cfg.http_host, "0.0.0.0");
    EXPECT_EQ(cfg.http_port, 5000);
    EXPECT_EQ(cfg.push_interval(), std::chrono::microseconds(100000));
    EXPECT_EQ(cfg.source_address(), cfg.drone_address);
}

TEST(ServiceConfig, ReadsEveryVariable) {
    FakeEnv env;
    env.vars = {
        {"DRONE_TYPE", "DJI"},
        {"DRONE_ADDRESS", "serial:///dev/ttyACM0:115200"},
        {"DJI_SOCK_PATH", "/run/bridge.sock"},
        {"DJI_RECONNECT_S", "0.5"},
        {"SOCKET_READ_TIMEOUT_S", "3"},
        {"CONNECT_TIMEOUT", "12"},
        {"TELEM_RATE_HZ", "5"},
        {"WS_RATE_HZ", "4"},
        {"HTTP_HOST", "127.0.0.1"},
        {"HTTP_PORT", "8080"},
    };
    ServiceConfig cfg = ServiceConfig::from_env(env.lookup());

    EXPECT_EQ(cfg.backend, Backend::Dji);
    EXPECT_EQ(cfg.drone_address, "serial:///dev/ttyACM0:115200");
    EXPECT_EQ(cfg.socket_path, "/run/bridge.sock");
    EXPECT_EQ(cfg.socket_reconnect_backoff, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.socket_read_timeout, std::chrono::milliseconds(3000));
    EXPECT_EQ(cfg.connect_timeout, std::chrono::milliseconds(12000));
    EXPECT_EQ(cfg.telemetry_rate_hz, 5.0);
    EXPECT_EQ(cfg.push_rate_hz, 4.0);
    EXPECT_EQ(cfg.http_host, "127.0.0.1");
    EXPECT_EQ(cfg.http_port, 8080);
    EXPECT_EQ(cfg.push_interval(), std::chrono::microseconds(250000));
    EXPECT_EQ(cfg.source_address(), "/run/bridge.sock");

    StatusInfo info = status_info(cfg);
    EXPECT_EQ(info.backend, "dji");
    EXPECT_EQ(info.source_address, "/run/bridge.sock");
    EXPECT_EQ(info.push_rate_hz, 4.0);
}

TEST(ServiceConfig, BackendAliases) {
    EXPECT_EQ(parse_backend("mavsdk"), Backend::Mavlink);
    EXPECT_EQ(parse_backend("MAVLink"), Backend::Mavlink);
    EXPECT_EQ(parse_backend("socket"), Backend::Dji);
    EXPECT_THROW(parse_backend("ardupilot"), ConfigError);
}

TEST(ServiceConfig, RejectsBadValues) {
    const std::vector<std::pair<std::string, std::string>> bad = {
        {"DRONE_TYPE", "px4"},
        {"TELEM_RATE_HZ", "0"},
        {"WS_RATE_HZ", "-1"},
        {"WS_RATE_HZ", "fast"},
        {"CONNECT_TIMEOUT", "10s"},
        {"DJI_RECONNECT_S", "nan"},
        {"HTTP_PORT", "0"},
        {"HTTP_PORT", "70000"},
        {"HTTP_PORT", "80.5"},
    };
    for (const auto& kv : bad) {
        FakeEnv env;
        env.vars[kv.first] = kv.second;
        EXPECT_THROW(ServiceConfig::from_env(env.lookup()), ConfigError)
            << kv.first << "=" << kv.second;
    }
}

TEST(ServiceConfig, EmptyValueFallsBackToDefault) {
    FakeEnv env;
    env.vars["HTTP_PORT"] = "";
    env.vars["DRONE_TYPE"] = "";
    ServiceConfig cfg = ServiceConfig::from_env(env.lookup());
    EXPECT_EQ(cfg.http_port, 5000);
    EXPECT_EQ(cfg.backend, Backend::Mavlink);
}

TEST(ServiceConfig, DumpNamesBackendAndListenAddress) {
    FakeEnv env;
    std::ostringstream out;
    ServiceConfig::from_env(env.lookup()).dump(out);
    EXPECT_NE(out.str().find("backend=mavlink"), std::string::npos);
    EXPECT_NE(out.str().find("http=0.0.0.0:5000"), std::string::npos);
}

TEST(LoadDotenv, SetsMissingVariablesOnly) {
    const std::string path = "/tmp/helios_test_" + std::to_string(::getpid()) + ".env";
    {
        std::ofstream f(path);
        f << "# comment\n"
          << "\n"
          << "HELIOS_TEST_PLAIN=one\n"
          << "export HELIOS_TEST_EXPORTED = \"two words\"\n"
          << "HELIOS_TEST_QUOTED='three'\r\n"
          << "HELIOS_TEST_PRESET=from-file\n"
          << "not a pair\n";
    }
    ::setenv("HELIOS_TEST_PRESET", "from-env", 1);

    ASSERT_TRUE(load_dotenv(path));
    EXPECT_STREQ(std::getenv("HELIOS_TEST_PLAIN"), "one");
    EXPECT_STREQ(std::getenv("HELIOS_TEST_EXPORTED"), "two words");
    EXPECT_STREQ(std::getenv("HELIOS_TEST_QUOTED"), "three");
    EXPECT_STREQ(std::getenv("HELIOS_TEST_PRESET"), "from-env");

    ::unsetenv("HELIOS_TEST_PLAIN");
    ::unsetenv("HELIOS_TEST_EXPORTED");
    ::unsetenv("HELIOS_TEST_QUOTED");
    ::unsetenv("HELIOS_TEST_PRESET");
    std::remove(path.c_str());
}

TEST(LoadDotenv, MissingFileReturnsFalse) {
    EXPECT_FALSE(load_dotenv("/nonexistent/helios/.env"));
}
