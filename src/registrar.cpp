#include "registrar.hpp"

#include "errors.hpp"
#include "sdp_record.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace {

void forceUnregister(const char* entity, const std::string& path, void (BluezBus::*unregister)(const std::string&), BluezBus& bus)
{
    try {
        (bus.*unregister)(path);
    } catch (const std::exception& ex) {
        std::cerr << "[btmouse] Ignoring failure to clear stale " << entity << " " << path << ": " << ex.what() << std::endl;
    }
}

} // namespace

Registrar::Registrar(BluezBus& bus, const ServiceIdentity& identity, const ServiceConfig& config, Sleeper sleeper)
    : bus_(bus)
    , identity_(identity)
    , config_(config)
    , sleeper_(std::move(sleeper))
{
}

RegistrationHandle Registrar::registerAgent(RegistrationHandle handle)
{
    handle.path = identity_.agentPath;
    handle.state = RegistrationState::Registering;

    const auto& policy = config_.registration;
    std::string lastError;
    for (unsigned attempt = 1; attempt <= policy.maxAttempts; ++attempt) {
        if (attempt > 1) {
            sleeper_(policy.delay);
        }
        try {
            bus_.registerAgent(handle.path, kAgentCapability);
        } catch (const ConflictError& ex) {
            lastError = ex.what();
            std::cerr << "[btmouse] Agent path " << handle.path << " already registered, clearing it" << std::endl;
            forceUnregister("agent", handle.path, &BluezBus::unregisterAgent, bus_);
            continue;
        } catch (const BusError& ex) {
            lastError = ex.what();
            std::cerr << "[btmouse] RegisterAgent attempt " << attempt << "/" << policy.maxAttempts << " failed: " << lastError << std::endl;
            continue;
        }

        try {
            bus_.requestDefaultAgent(handle.path);
        } catch (const BusError& ex) {
            lastError = ex.what();
            std::cerr << "[btmouse] RequestDefaultAgent attempt " << attempt << "/" << policy.maxAttempts << " failed: " << lastError << std::endl;
            forceUnregister("agent", handle.path, &BluezBus::unregisterAgent, bus_);
            continue;
        }

        std::cout << "[btmouse] Agent registered at " << handle.path << " (" << kAgentCapability << ")" << std::endl;
        handle.state = RegistrationState::Registered;
        return handle;
    }

    throw RegistrationError("agent", lastError, policy.maxAttempts);
}

RegistrationHandle Registrar::registerProfile(RegistrationHandle handle)
{
    handle.path = identity_.profilePath;
    handle.state = RegistrationState::Registering;

    const auto& policy = config_.registration;
    std::string lastError;
    for (unsigned attempt = 1; attempt <= policy.maxAttempts; ++attempt) {
        if (attempt > 1) {
            sleeper_(policy.delay);
        }
        try {
            bus_.registerProfile(handle.path, identity_.serviceUuid, profileOptions());
        } catch (const ConflictError& ex) {
            lastError = ex.what();
            std::cerr << "[btmouse] Profile path " << handle.path << " already registered, clearing it" << std::endl;
            forceUnregister("profile", handle.path, &BluezBus::unregisterProfile, bus_);
            continue;
        } catch (const BusError& ex) {
            lastError = ex.what();
            std::cerr << "[btmouse] RegisterProfile attempt " << attempt << "/" << policy.maxAttempts << " failed: " << lastError << std::endl;
            continue;
        }

        std::cout << "[btmouse] Profile registered at " << handle.path << " (" << identity_.serviceUuid << ")" << std::endl;
        handle.state = RegistrationState::Registered;
        return handle;
    }

    throw RegistrationError("profile", lastError, policy.maxAttempts);
}

RegistrationHandle Registrar::unregisterAgent(RegistrationHandle handle) noexcept
{
    if (!handle.registered()) {
        return handle;
    }
    try {
        bus_.unregisterAgent(handle.path);
        std::cout << "[btmouse] Agent unregistered" << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[btmouse] UnregisterAgent failed: " << ex.what() << std::endl;
    }
    handle.state = RegistrationState::Unregistered;
    return handle;
}

RegistrationHandle Registrar::unregisterProfile(RegistrationHandle handle) noexcept
{
    if (!handle.registered()) {
        return handle;
    }
    try {
        bus_.unregisterProfile(handle.path);
        std::cout << "[btmouse] Profile unregistered" << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[btmouse] UnregisterProfile failed: " << ex.what() << std::endl;
    }
    handle.state = RegistrationState::Unregistered;
    return handle;
}

ProfileOptions Registrar::profileOptions() const
{
    ProfileOptions options;
    options.name = config_.device.deviceName;
    options.serviceRecord = buildSdpRecord(identity_, config_.device, config_.transport);
    return options;
}
