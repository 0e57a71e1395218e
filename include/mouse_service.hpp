#pragma once

#include "adapter_prober.hpp"
#include "bluez_bus.hpp"
#include "control_surface.hpp"
#include "hid_report.hpp"
#include "pointer_source.hpp"
#include "registrar.hpp"
#include "report_transport.hpp"
#include "service_config.hpp"
#include "service_identity.hpp"
#include "shutdown_signal.hpp"

#include <memory>
#include <string>

struct ServiceCollaborators {
    ControlSurface& control;
    BusConnector& connector;
    PointerSource& pointer;
    ReportTransport* transport{nullptr};
    Sleeper sleeper;
};

// Startup: adapter readiness, bus connection, agent then profile
// registration. Then the sampling loop until `shutdown` fires, then
// teardown in reverse registration order.
class MouseService {
public:
    MouseService(ServiceConfig config, ServiceIdentity identity, ServiceCollaborators collaborators);
    ~MouseService();

    MouseService(const MouseService&) = delete;
    MouseService& operator=(const MouseService&) = delete;

    // Returns the process exit status.
    int run(ShutdownSignal& shutdown);

    // Unregisters whatever is still registered. Safe to call repeatedly.
    void cleanup() noexcept;

    const ServiceIdentity& identity() const noexcept { return identity_; }
    const RegistrationHandle& agent() const noexcept { return agent_; }
    const RegistrationHandle& profile() const noexcept { return profile_; }

private:
    bool startup();
    void samplingLoop(ShutdownSignal& shutdown);
    void tick();
    void reportFatal(const std::string& stage, const std::string& detail, const std::string& remedy) const;

    ServiceConfig config_;
    ServiceIdentity identity_;
    ServiceCollaborators collaborators_;
    AdapterProber prober_;

    std::unique_ptr<BluezBus> bus_;
    std::unique_ptr<Registrar> registrar_;
    RegistrationHandle agent_;
    RegistrationHandle profile_;

    PointerSample previous_;
    HIDReport lastSent_;
    bool transportActive_{false};
};
