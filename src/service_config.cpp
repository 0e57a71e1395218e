#include "service_config.hpp"

#include "errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

namespace {

std::string resolveEnvTokens(std::string value)
{
    if (value.size() < 4 || value[0] != '$' || value[1] != '{' || value.back() != '}') {
        return value;
    }

    const auto inner = value.substr(2, value.size() - 3);
    const auto colonPos = inner.find(':');
    const auto key = inner.substr(0, colonPos);
    std::string defaultValue;
    if (colonPos != std::string::npos) {
        defaultValue = inner.substr(colonPos + 1);
    }

    if (const char* envValue = std::getenv(key.c_str()); envValue != nullptr) {
        return envValue;
    }

    return defaultValue;
}

std::string getString(const YAML::Node& node, std::string_view key, const std::string& fallback)
{
    if (!node || !node[key.data()]) {
        return fallback;
    }

    auto value = node[key.data()].as<std::string>();
    return resolveEnvTokens(value);
}

unsigned long getUnsigned(const YAML::Node& node, std::string_view key, unsigned long fallback, unsigned long max)
{
    if (!node || !node[key.data()]) {
        return fallback;
    }

    const auto raw = resolveEnvTokens(node[key.data()].as<std::string>());
    try {
        if (!raw.empty() && raw.front() == '-') {
            throw std::out_of_range("negative value");
        }
        const auto parsed = std::stoul(raw, nullptr, 0);
        if (parsed > max) {
            throw std::out_of_range("value out of range");
        }
        return parsed;
    } catch (const std::exception& ex) {
        throw ConfigError("Failed to parse numeric value for key '" + std::string(key) + "': " + ex.what());
    }
}

uint16_t getUInt16(const YAML::Node& node, std::string_view key, uint16_t fallback)
{
    return static_cast<uint16_t>(getUnsigned(node, key, fallback, std::numeric_limits<uint16_t>::max()));
}

unsigned getCount(const YAML::Node& node, std::string_view key, unsigned fallback)
{
    const auto value = getUnsigned(node, key, fallback, std::numeric_limits<unsigned>::max());
    if (value == 0) {
        throw ConfigError("Value for key '" + std::string(key) + "' must be at least 1");
    }
    return static_cast<unsigned>(value);
}

std::chrono::milliseconds getMillis(const YAML::Node& node, std::string_view key, std::chrono::milliseconds fallback)
{
    const auto value = getUnsigned(node, key, static_cast<unsigned long>(fallback.count()), std::numeric_limits<int>::max());
    return std::chrono::milliseconds{value};
}

std::string getCommand(const YAML::Node& node, std::string_view key, const std::string& fallback)
{
    auto value = getString(node, key, fallback);
    if (value.find_first_not_of(" \t") == std::string::npos) {
        throw ConfigError("Value for key '" + std::string(key) + "' must not be empty");
    }
    return value;
}

bool getBool(const YAML::Node& node, std::string_view key, bool fallback)
{
    if (!node || !node[key.data()]) {
        return fallback;
    }

    const auto valueStr = resolveEnvTokens(node[key.data()].as<std::string>());
    if (valueStr == "1" || valueStr == "true" || valueStr == "True" || valueStr == "yes") {
        return true;
    }
    if (valueStr == "0" || valueStr == "false" || valueStr == "False" || valueStr == "no") {
        return false;
    }
    throw ConfigError("Failed to parse boolean for key '" + std::string(key) + "'");
}

void loadRetryPolicy(const YAML::Node& node, RetryPolicy& policy)
{
    policy.maxAttempts = getCount(node, "max_attempts", policy.maxAttempts);
    policy.delay = getMillis(node, "retry_delay_ms", policy.delay);
}

} // namespace

ServiceConfig loadServiceConfig(const std::string& path)
{
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Configuration file not found: " + path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw ConfigError("Failed to parse " + path + ": " + ex.what());
    }

    ServiceConfig config;

    config.device.deviceName = getString(root, "device_name", config.device.deviceName);
    config.device.description = getString(root, "description", config.device.description);
    config.device.provider = getString(root, "provider", config.device.provider);

    if (const auto identityNode = root["identity"]; identityNode) {
        config.identity.agentRoot = getString(identityNode, "agent_root", config.identity.agentRoot);
        config.identity.profileRoot = getString(identityNode, "profile_root", config.identity.profileRoot);
    }

    if (const auto controlNode = root["adapter_control"]; controlNode) {
        auto& control = config.adapterControl;
        control.tool = getCommand(controlNode, "tool", control.tool);
        control.restartCommand = getCommand(controlNode, "restart_command", control.restartCommand);
        control.commandTimeout = getMillis(controlNode, "command_timeout_ms", control.commandTimeout);
        control.restartSettle = getMillis(controlNode, "restart_settle_ms", control.restartSettle);
        control.powerSettle = getMillis(controlNode, "power_settle_ms", control.powerSettle);
    }

    if (const auto busNode = root["bus"]; busNode) {
        loadRetryPolicy(busNode, config.bus.retry);
        config.bus.callTimeout = getMillis(busNode, "call_timeout_ms", config.bus.callTimeout);
    }

    if (const auto registrationNode = root["registration"]; registrationNode) {
        loadRetryPolicy(registrationNode, config.registration);
    }

    if (const auto samplingNode = root["sampling"]; samplingNode) {
        config.sampling.tick = getMillis(samplingNode, "tick_ms", config.sampling.tick);
        if (config.sampling.tick.count() == 0) {
            throw ConfigError("Value for key 'tick_ms' must be at least 1");
        }
        config.sampling.inputDevice = getString(samplingNode, "input_device", config.sampling.inputDevice);
        config.sampling.grab = getBool(samplingNode, "grab", config.sampling.grab);
        config.sampling.logReports = getBool(samplingNode, "log_reports", config.sampling.logReports);
    }

    if (const auto transportNode = root["transport"]; transportNode) {
        config.transport.enabled = getBool(transportNode, "enabled", config.transport.enabled);
        config.transport.controlPsm = getUInt16(transportNode, "control_psm", config.transport.controlPsm);
        config.transport.interruptPsm = getUInt16(transportNode, "interrupt_psm", config.transport.interruptPsm);
    }

    return config;
}

ServiceConfig loadServiceConfigFromEnvironment()
{
    if (const char* envPath = std::getenv(kConfigPathEnv)) {
        return loadServiceConfig(envPath);
    }

    if (!std::filesystem::exists(kDefaultConfigPath)) {
        std::cout << "[btmouse] No configuration at " << kDefaultConfigPath << ", using defaults" << std::endl;
        return ServiceConfig{};
    }
    return loadServiceConfig(kDefaultConfigPath);
}
