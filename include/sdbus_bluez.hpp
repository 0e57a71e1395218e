#pragma once

#include "bluez_bus.hpp"
#include "service_config.hpp"
#include "service_identity.hpp"

#include <memory>
#include <string>

// System-bus session with org.bluez. Construction connects, checks that
// the daemon answers, exports the pairing agent and profile objects at the
// identity's paths and starts the event loop thread that serves them.
class SdbusBluez : public BluezBus {
public:
    SdbusBluez(const ServiceIdentity& identity, const BusConfig& config);
    ~SdbusBluez() override;

    void registerAgent(const std::string& path, const std::string& capability) override;
    void requestDefaultAgent(const std::string& path) override;
    void unregisterAgent(const std::string& path) override;

    void registerProfile(const std::string& path, const std::string& uuid, const ProfileOptions& options) override;
    void unregisterProfile(const std::string& path) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

class SdbusConnector : public BusConnector {
public:
    SdbusConnector(ServiceIdentity identity, BusConfig config);

    std::unique_ptr<BluezBus> open() override;

private:
    ServiceIdentity identity_;
    BusConfig config_;
};
