#pragma once

#include <memory>
#include <string>

struct ProfileOptions {
    std::string name;
    std::string role{"server"};
    bool requireAuthentication{false};
    bool requireAuthorization{false};
    bool autoConnect{true};
    std::string serviceRecord;
};

// org.bluez AgentManager1 / ProfileManager1 as seen from this service.
// Every call is bounded by the implementation's call timeout and reports
// faults as BusError (ConflictError for an already registered path).
class BluezBus {
public:
    virtual ~BluezBus() = default;

    virtual void registerAgent(const std::string& path, const std::string& capability) = 0;
    virtual void requestDefaultAgent(const std::string& path) = 0;
    virtual void unregisterAgent(const std::string& path) = 0;

    virtual void registerProfile(const std::string& path, const std::string& uuid, const ProfileOptions& options) = 0;
    virtual void unregisterProfile(const std::string& path) = 0;
};

class BusConnector {
public:
    virtual ~BusConnector() = default;

    // Throws BusError when the bus or the Bluetooth daemon is unreachable.
    virtual std::unique_ptr<BluezBus> open() = 0;
};
