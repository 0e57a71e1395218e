#pragma once

#include "service_config.hpp"

#include <cstdint>
#include <string>

constexpr const char* kHidServiceUuid = "00001124-0000-1000-8000-00805f9b34fb";

struct ServiceIdentity {
    int processId{0};
    uint16_t instanceSuffix{0};
    std::string serviceUuid;
    std::string agentPath;
    std::string profilePath;
};

// Suffix rendered as four lowercase hex digits, e.g. 0x2ab3 -> "2ab3".
std::string formatInstanceSuffix(uint16_t suffix);

ServiceIdentity makeServiceIdentity(int processId, uint16_t instanceSuffix, const IdentityConfig& config);

// Uses the current process id and a random 16-bit suffix.
ServiceIdentity generateServiceIdentity(const IdentityConfig& config);
