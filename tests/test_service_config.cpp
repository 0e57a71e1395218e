#include <catch2/catch.hpp>

#include "errors.hpp"
#include "service_config.hpp"

#include <cstdlib>
#include <fstream>
#include <string>

#include <unistd.h>

namespace {

class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& contents)
    {
        char pattern[] = "/tmp/btmouse-config-XXXXXX";
        const int fd = ::mkstemp(pattern);
        REQUIRE(fd >= 0);
        ::close(fd);
        path_ = pattern;
        std::ofstream out(path_);
        out << contents;
    }

    ~TempConfigFile() { ::unlink(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

TEST_CASE("Empty config keeps built-in defaults", "[config]")
{
    TempConfigFile file("{}\n");
    const auto config = loadServiceConfig(file.path());

    REQUIRE(config.device.deviceName == "HID Mouse");
    REQUIRE(config.identity.agentRoot == "/org/bluez/agent");
    REQUIRE(config.identity.profileRoot == "/org/bluez/hid");
    REQUIRE(config.bus.retry.maxAttempts == 3);
    REQUIRE(config.bus.retry.delay == std::chrono::milliseconds{2000});
    REQUIRE(config.registration.maxAttempts == 3);
    REQUIRE(config.registration.delay == std::chrono::milliseconds{1000});
    REQUIRE(config.sampling.tick == std::chrono::milliseconds{10});
    REQUIRE(config.sampling.logReports);
    REQUIRE(config.transport.enabled);
    REQUIRE(config.transport.controlPsm == 0x11);
    REQUIRE(config.transport.interruptPsm == 0x13);
}

TEST_CASE("Every section is read from YAML", "[config]")
{
    TempConfigFile file(
        "device_name: Desk Mouse\n"
        "identity:\n"
        "  agent_root: /com/example/agent\n"
        "adapter_control:\n"
        "  tool: /usr/local/bin/bluetoothctl\n"
        "  command_timeout_ms: 750\n"
        "bus:\n"
        "  max_attempts: 5\n"
        "  retry_delay_ms: 100\n"
        "registration:\n"
        "  max_attempts: 4\n"
        "sampling:\n"
        "  tick_ms: 8\n"
        "  grab: yes\n"
        "  log_reports: false\n"
        "transport:\n"
        "  enabled: false\n"
        "  control_psm: 0x1011\n");
    const auto config = loadServiceConfig(file.path());

    REQUIRE(config.device.deviceName == "Desk Mouse");
    REQUIRE(config.identity.agentRoot == "/com/example/agent");
    REQUIRE(config.identity.profileRoot == "/org/bluez/hid");
    REQUIRE(config.adapterControl.tool == "/usr/local/bin/bluetoothctl");
    REQUIRE(config.adapterControl.commandTimeout == std::chrono::milliseconds{750});
    REQUIRE(config.bus.retry.maxAttempts == 5);
    REQUIRE(config.bus.retry.delay == std::chrono::milliseconds{100});
    REQUIRE(config.registration.maxAttempts == 4);
    REQUIRE(config.sampling.tick == std::chrono::milliseconds{8});
    REQUIRE(config.sampling.grab);
    REQUIRE_FALSE(config.sampling.logReports);
    REQUIRE_FALSE(config.transport.enabled);
    REQUIRE(config.transport.controlPsm == 0x1011);
    REQUIRE(config.transport.interruptPsm == 0x13);
}

TEST_CASE("Environment tokens resolve with defaults", "[config][env]")
{
    ::setenv("BTMOUSE_TEST_DEVICE_NAME", "Travel Mouse", 1);
    ::unsetenv("BTMOUSE_TEST_UNSET_DEVICE");
    TempConfigFile file(
        "device_name: ${BTMOUSE_TEST_DEVICE_NAME:HID Mouse}\n"
        "sampling:\n"
        "  input_device: ${BTMOUSE_TEST_UNSET_DEVICE:/dev/input/event3}\n");
    const auto config = loadServiceConfig(file.path());
    ::unsetenv("BTMOUSE_TEST_DEVICE_NAME");

    REQUIRE(config.device.deviceName == "Travel Mouse");
    REQUIRE(config.sampling.inputDevice == "/dev/input/event3");
}

TEST_CASE("Missing file is a configuration error", "[config][errors]")
{
    REQUIRE_THROWS_AS(loadServiceConfig("/nonexistent/btmouse.yml"), ConfigError);
}

TEST_CASE("Malformed values are configuration errors", "[config][errors]")
{
    SECTION("non-numeric timeout")
    {
        TempConfigFile file("adapter_control:\n  command_timeout_ms: soon\n");
        REQUIRE_THROWS_AS(loadServiceConfig(file.path()), ConfigError);
    }
    SECTION("negative delay")
    {
        TempConfigFile file("bus:\n  retry_delay_ms: -5\n");
        REQUIRE_THROWS_AS(loadServiceConfig(file.path()), ConfigError);
    }
    SECTION("zero attempts")
    {
        TempConfigFile file("registration:\n  max_attempts: 0\n");
        REQUIRE_THROWS_AS(loadServiceConfig(file.path()), ConfigError);
    }
    SECTION("zero tick")
    {
        TempConfigFile file("sampling:\n  tick_ms: 0\n");
        REQUIRE_THROWS_AS(loadServiceConfig(file.path()), ConfigError);
    }
    SECTION("PSM wider than 16 bits")
    {
        TempConfigFile file("transport:\n  interrupt_psm: 0x10013\n");
        REQUIRE_THROWS_AS(loadServiceConfig(file.path()), ConfigError);
    }
    SECTION("unknown boolean")
    {
        TempConfigFile file("sampling:\n  grab: maybe\n");
        REQUIRE_THROWS_AS(loadServiceConfig(file.path()), ConfigError);
    }
    SECTION("empty restart command")
    {
        TempConfigFile file("adapter_control:\n  restart_command: \"  \"\n");
        REQUIRE_THROWS_AS(loadServiceConfig(file.path()), ConfigError);
    }
    SECTION("empty tool")
    {
        TempConfigFile file("adapter_control:\n  tool: \"\"\n");
        REQUIRE_THROWS_AS(loadServiceConfig(file.path()), ConfigError);
    }
    SECTION("timeout beyond what poll accepts")
    {
        TempConfigFile file("adapter_control:\n  command_timeout_ms: 3000000000\n");
        REQUIRE_THROWS_AS(loadServiceConfig(file.path()), ConfigError);
    }
    SECTION("unparseable YAML")
    {
        TempConfigFile file("sampling: [unclosed\n");
        REQUIRE_THROWS_AS(loadServiceConfig(file.path()), ConfigError);
    }
}

TEST_CASE("Environment variable selects the config file", "[config][env]")
{
    TempConfigFile file("device_name: From Env\n");
    ::setenv(kConfigPathEnv, file.path().c_str(), 1);
    const auto config = loadServiceConfigFromEnvironment();
    ::unsetenv(kConfigPathEnv);

    REQUIRE(config.device.deviceName == "From Env");
}
