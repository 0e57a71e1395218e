#pragma once

#include "adapter_prober.hpp"
#include "bluez_bus.hpp"
#include "service_config.hpp"
#include "service_identity.hpp"

#include <string>

enum class RegistrationState {
    Unregistered,
    Registering,
    Registered
};

struct RegistrationHandle {
    std::string path;
    RegistrationState state{RegistrationState::Unregistered};

    [[nodiscard]] bool registered() const noexcept { return state == RegistrationState::Registered; }
};

constexpr const char* kAgentCapability = "NoInputNoOutput";

class Registrar {
public:
    Registrar(BluezBus& bus, const ServiceIdentity& identity, const ServiceConfig& config, Sleeper sleeper);

    // Each returns the handle in its new state. Register operations throw
    // RegistrationError after the last attempt. Conflict recovery may already
    // have removed an earlier registration at the same path, so after a throw
    // the caller must treat its handle as Unregistered whatever state it held.
    RegistrationHandle registerAgent(RegistrationHandle handle);
    RegistrationHandle registerProfile(RegistrationHandle handle);

    // Best effort, never throw. Unregistered handles are returned untouched
    // without a bus call.
    RegistrationHandle unregisterAgent(RegistrationHandle handle) noexcept;
    RegistrationHandle unregisterProfile(RegistrationHandle handle) noexcept;

private:
    ProfileOptions profileOptions() const;

    BluezBus& bus_;
    const ServiceIdentity& identity_;
    const ServiceConfig& config_;
    Sleeper sleeper_;
};
