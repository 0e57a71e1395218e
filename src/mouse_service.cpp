#include "mouse_service.hpp"

#include "bus_session.hpp"
#include "errors.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace {

std::string formatReport(const HIDReport& report)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : report.bytes()) {
        oss << std::setw(2) << static_cast<unsigned>(byte) << ' ';
    }
    oss << std::dec << "(dx=" << static_cast<int>(report.dx) << " dy=" << static_cast<int>(report.dy) << ")";
    return oss.str();
}

} // namespace

MouseService::MouseService(ServiceConfig config, ServiceIdentity identity, ServiceCollaborators collaborators)
    : config_(std::move(config))
    , identity_(std::move(identity))
    , collaborators_(std::move(collaborators))
    , prober_(collaborators_.control, config_.adapterControl, collaborators_.sleeper)
{
    agent_.path = identity_.agentPath;
    profile_.path = identity_.profilePath;
}

MouseService::~MouseService()
{
    cleanup();
    registrar_.reset();
    bus_.reset();
}

int MouseService::run(ShutdownSignal& shutdown)
{
    std::cout << "[btmouse] Service " << identity_.serviceUuid << " (pid " << identity_.processId << ")" << std::endl;

    bool ready = false;
    try {
        ready = startup();
    } catch (const std::exception& ex) {
        reportFatal("startup", ex.what(), "check the service logs and the Bluetooth daemon status");
    }

    if (!ready) {
        cleanup();
        return 1;
    }

    if (shutdown.stopRequested()) {
        std::cout << "[btmouse] Shutdown requested during startup" << std::endl;
    } else {
        samplingLoop(shutdown);
    }

    std::cout << "[btmouse] Shutting down" << std::endl;
    cleanup();
    return 0;
}

bool MouseService::startup()
{
    try {
        prober_.ensureReady();
    } catch (const AdapterError& ex) {
        std::cerr << "[btmouse] Adapter not ready: " << ex.what()
                  << ". Continuing; try 'sudo systemctl restart bluetooth' if pairing fails." << std::endl;
    }

    BusSessionManager session(collaborators_.connector, prober_, config_.bus.retry, collaborators_.sleeper);
    try {
        bus_ = session.connect();
    } catch (const ConnectionError& ex) {
        reportFatal("bus", ex.what(), "start the Bluetooth daemon with 'sudo systemctl restart bluetooth' and check D-Bus permissions");
        return false;
    }

    registrar_ = std::make_unique<Registrar>(*bus_, identity_, config_, collaborators_.sleeper);

    try {
        agent_ = registrar_->registerAgent(agent_);
    } catch (const RegistrationError& ex) {
        agent_.state = RegistrationState::Unregistered;
        std::cerr << "[btmouse] " << ex.what() << ". Continuing without a pairing agent; pairing may require manual confirmation." << std::endl;
    }

    try {
        profile_ = registrar_->registerProfile(profile_);
    } catch (const RegistrationError& ex) {
        profile_.state = RegistrationState::Unregistered;
        reportFatal("profile", ex.what(), "restart the Bluetooth daemon ('sudo systemctl restart bluetooth') and make sure no other HID profile holds the adapter");
        return false;
    }

    if (collaborators_.transport) {
        try {
            collaborators_.transport->start();
            transportActive_ = true;
        } catch (const std::exception& ex) {
            std::cerr << "[btmouse] HID transport unavailable: " << ex.what()
                      << ". Reports will not be delivered; run bluetoothd with '--noplugin=input' to free the HID channels." << std::endl;
        }
    }

    return true;
}

void MouseService::samplingLoop(ShutdownSignal& shutdown)
{
    try {
        previous_ = collaborators_.pointer.sample();
    } catch (const std::exception& ex) {
        std::cerr << "[btmouse] Initial pointer sample failed: " << ex.what() << std::endl;
    }

    std::cout << "[btmouse] Sampling every " << config_.sampling.tick.count() << " ms" << std::endl;
    while (!shutdown.stopRequested()) {
        try {
            tick();
        } catch (const std::exception& ex) {
            std::cerr << "[btmouse] Sampling error: " << ex.what() << std::endl;
        }
        if (shutdown.waitFor(config_.sampling.tick)) {
            break;
        }
    }
}

void MouseService::tick()
{
    auto* transport = transportActive_ ? collaborators_.transport : nullptr;
    if (transport) {
        transport->service();
    }

    const auto current = collaborators_.pointer.sample();
    const auto report = encodeMouseReport(previous_, current);
    previous_ = current;

    if (!report.isIdle() && config_.sampling.logReports) {
        std::cout << "[btmouse] Report " << formatReport(report) << std::endl;
    }

    if (!transport || !transport->connected()) {
        return;
    }
    if (report.isIdle() && report.buttonMask == lastSent_.buttonMask) {
        return;
    }
    if (transport->send(report)) {
        lastSent_ = report;
    }
}

void MouseService::cleanup() noexcept
{
    if (transportActive_ && collaborators_.transport) {
        collaborators_.transport->stop();
        transportActive_ = false;
    }
    if (registrar_) {
        profile_ = registrar_->unregisterProfile(profile_);
        agent_ = registrar_->unregisterAgent(agent_);
    }
}

void MouseService::reportFatal(const std::string& stage, const std::string& detail, const std::string& remedy) const
{
    std::cerr << "[btmouse] Fatal: " << stage << " stage failed: " << detail << std::endl;
    std::cerr << "[btmouse] Remedy: " << remedy << std::endl;
}
