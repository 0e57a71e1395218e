#pragma once

#include <chrono>
#include <cstdint>
#include <string>

struct DeviceConfig {
    std::string deviceName{"HID Mouse"};
    std::string description{"Bluetooth HID mouse"};
    std::string provider{"btmouse"};
};

struct IdentityConfig {
    std::string agentRoot{"/org/bluez/agent"};
    std::string profileRoot{"/org/bluez/hid"};
};

struct AdapterControlConfig {
    std::string tool{"bluetoothctl"};
    std::string restartCommand{"systemctl restart bluetooth"};
    std::chrono::milliseconds commandTimeout{5000};
    std::chrono::milliseconds restartSettle{5000};
    std::chrono::milliseconds powerSettle{2000};
};

struct RetryPolicy {
    unsigned maxAttempts{3};
    std::chrono::milliseconds delay{1000};
};

struct BusConfig {
    RetryPolicy retry{3, std::chrono::milliseconds{2000}};
    std::chrono::milliseconds callTimeout{5000};
};

struct SamplingConfig {
    std::chrono::milliseconds tick{10};
    std::string inputDevice{"auto"};
    bool grab{false};
    bool logReports{true};
};

struct TransportConfig {
    bool enabled{true};
    uint16_t controlPsm{0x11};
    uint16_t interruptPsm{0x13};
};

struct ServiceConfig {
    DeviceConfig device;
    IdentityConfig identity;
    AdapterControlConfig adapterControl;
    BusConfig bus;
    RetryPolicy registration;
    SamplingConfig sampling;
    TransportConfig transport;
};

constexpr const char* kDefaultConfigPath = "/etc/btmouse/btmouse.yml";
constexpr const char* kConfigPathEnv = "BTMOUSE_CONFIG";

// Throws ConfigError when the file is missing or a value does not parse.
ServiceConfig loadServiceConfig(const std::string& path);

// Resolves the config path from the environment; falls back to built-in
// defaults only when the default path is absent.
ServiceConfig loadServiceConfigFromEnvironment();
