#include "service_identity.hpp"

#include <iomanip>
#include <random>
#include <sstream>

#include <unistd.h>

std::string formatInstanceSuffix(uint16_t suffix)
{
    std::ostringstream oss;
    oss << std::hex << std::setw(4) << std::setfill('0') << suffix;
    return oss.str();
}

ServiceIdentity makeServiceIdentity(int processId, uint16_t instanceSuffix, const IdentityConfig& config)
{
    const auto suffix = formatInstanceSuffix(instanceSuffix);
    const auto instance = std::to_string(processId) + "_" + suffix;

    std::string uuid{kHidServiceUuid};
    uuid.replace(uuid.size() - 4, 4, suffix);

    ServiceIdentity identity;
    identity.processId = processId;
    identity.instanceSuffix = instanceSuffix;
    identity.serviceUuid = std::move(uuid);
    identity.agentPath = config.agentRoot + "/" + instance;
    identity.profilePath = config.profileRoot + "/" + instance;
    return identity;
}

ServiceIdentity generateServiceIdentity(const IdentityConfig& config)
{
    std::random_device device;
    std::uniform_int_distribution<unsigned> distribution(0, 0xFFFF);
    return makeServiceIdentity(static_cast<int>(::getpid()), static_cast<uint16_t>(distribution(device)), config);
}
