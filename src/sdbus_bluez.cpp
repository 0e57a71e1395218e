#include "sdbus_bluez.hpp"

#include "errors.hpp"

#include <sdbus-c++/sdbus-c++.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <string_view>
#include <thread>
#include <utility>

namespace {

constexpr std::string_view kBluezService{"org.bluez"};
constexpr std::string_view kBluezRootPath{"/org/bluez"};
constexpr std::string_view kPeerInterface{"org.freedesktop.DBus.Peer"};
constexpr std::string_view kAgentManagerInterface{"org.bluez.AgentManager1"};
constexpr std::string_view kProfileManagerInterface{"org.bluez.ProfileManager1"};
constexpr std::string_view kAgentInterface{"org.bluez.Agent1"};
constexpr std::string_view kProfileInterface{"org.bluez.Profile1"};

constexpr const char* kErrorRejected = "org.bluez.Error.Rejected";

[[noreturn]] void rethrowAsBusError(const sdbus::Error& error)
{
    if (error.getName() == kErrorAlreadyExists) {
        throw ConflictError(error.getMessage());
    }
    throw BusError(error.getName(), error.getMessage());
}

// NoInputNoOutput agent: accepts confirmations and authorizations, has
// no way to produce a PIN or passkey.
class PairingAgent {
public:
    PairingAgent(sdbus::IConnection& connection, std::string path)
        : object_(sdbus::createObject(connection, std::move(path)))
    {
        object_->registerMethod("Release")
            .onInterface(kAgentInterface.data())
            .implementedAs([]() { std::cout << "[btmouse] Agent released by BlueZ" << std::endl; });

        object_->registerMethod("RequestPinCode")
            .onInterface(kAgentInterface.data())
            .withInputParamNames("device")
            .withOutputParamNames("pincode")
            .implementedAs([](const sdbus::ObjectPath& device) -> std::string {
                std::cerr << "[btmouse] PIN requested by " << device << ", rejecting" << std::endl;
                throw sdbus::Error(kErrorRejected, "PIN entry not supported");
            });

        object_->registerMethod("DisplayPinCode")
            .onInterface(kAgentInterface.data())
            .withInputParamNames("device", "pincode")
            .implementedAs([](const sdbus::ObjectPath& device, const std::string&) {
                std::cout << "[btmouse] PIN display requested by " << device << std::endl;
            });

        object_->registerMethod("RequestPasskey")
            .onInterface(kAgentInterface.data())
            .withInputParamNames("device")
            .withOutputParamNames("passkey")
            .implementedAs([](const sdbus::ObjectPath& device) -> uint32_t {
                std::cerr << "[btmouse] Passkey requested by " << device << ", rejecting" << std::endl;
                throw sdbus::Error(kErrorRejected, "Passkey entry not supported");
            });

        object_->registerMethod("DisplayPasskey")
            .onInterface(kAgentInterface.data())
            .withInputParamNames("device", "passkey", "entered")
            .implementedAs([](const sdbus::ObjectPath& device, uint32_t, uint16_t) {
                std::cout << "[btmouse] Passkey display requested by " << device << std::endl;
            });

        object_->registerMethod("RequestConfirmation")
            .onInterface(kAgentInterface.data())
            .withInputParamNames("device", "passkey")
            .implementedAs([](const sdbus::ObjectPath& device, uint32_t) {
                std::cout << "[btmouse] Pairing confirmed for " << device << std::endl;
            });

        object_->registerMethod("RequestAuthorization")
            .onInterface(kAgentInterface.data())
            .withInputParamNames("device")
            .implementedAs([](const sdbus::ObjectPath& device) {
                std::cout << "[btmouse] Pairing authorized for " << device << std::endl;
            });

        object_->registerMethod("AuthorizeService")
            .onInterface(kAgentInterface.data())
            .withInputParamNames("device", "uuid")
            .implementedAs([](const sdbus::ObjectPath& device, const std::string& uuid) {
                std::cout << "[btmouse] Service " << uuid << " authorized for " << device << std::endl;
            });

        object_->registerMethod("Cancel")
            .onInterface(kAgentInterface.data())
            .implementedAs([]() { std::cout << "[btmouse] Pairing request cancelled" << std::endl; });

        object_->finishRegistration();
    }

private:
    std::unique_ptr<sdbus::IObject> object_;
};

class HidProfile {
public:
    HidProfile(sdbus::IConnection& connection, std::string path)
        : object_(sdbus::createObject(connection, std::move(path)))
    {
        object_->registerMethod("Release")
            .onInterface(kProfileInterface.data())
            .implementedAs([]() { std::cout << "[btmouse] Profile released by BlueZ" << std::endl; });

        // HID traffic runs over our own L2CAP listeners; the descriptor
        // handed over here is closed when `fd` goes out of scope.
        object_->registerMethod("NewConnection")
            .onInterface(kProfileInterface.data())
            .withInputParamNames("device", "fd", "fd_properties")
            .implementedAs([](const sdbus::ObjectPath& device, const sdbus::UnixFd& fd, const std::map<std::string, sdbus::Variant>&) {
                std::cout << "[btmouse] Profile connection from " << device << " (fd " << fd.get() << ")" << std::endl;
            });

        object_->registerMethod("RequestDisconnection")
            .onInterface(kProfileInterface.data())
            .withInputParamNames("device")
            .implementedAs([](const sdbus::ObjectPath& device) {
                std::cout << "[btmouse] Disconnection requested by " << device << std::endl;
            });

        object_->finishRegistration();
    }

private:
    std::unique_ptr<sdbus::IObject> object_;
};

} // namespace

class SdbusBluez::Impl {
public:
    Impl(const ServiceIdentity& identity, const BusConfig& config)
        : callTimeout_(std::chrono::duration_cast<std::chrono::microseconds>(config.callTimeout))
    {
        try {
            connection_ = sdbus::createSystemBusConnection();

            // fails with ServiceUnknown when bluetoothd is not on the bus
            auto peer = sdbus::createProxy(*connection_, std::string{kBluezService}, "/");
            peer->callMethod("Ping").onInterface(kPeerInterface.data()).withTimeout(callTimeout_);

            agent_ = std::make_unique<PairingAgent>(*connection_, identity.agentPath);
            profile_ = std::make_unique<HidProfile>(*connection_, identity.profilePath);
            bluez_ = sdbus::createProxy(*connection_, std::string{kBluezService}, std::string{kBluezRootPath});
        } catch (const sdbus::Error& ex) {
            rethrowAsBusError(ex);
        }

        eventThread_ = std::thread([this]() {
            try {
                connection_->enterEventLoop();
            } catch (const std::exception& ex) {
                std::cerr << "[btmouse] D-Bus event loop terminated: " << ex.what() << std::endl;
            }
        });
    }

    ~Impl()
    {
        if (connection_) {
            connection_->leaveEventLoop();
        }
        if (eventThread_.joinable()) {
            eventThread_.join();
        }
        bluez_.reset();
        profile_.reset();
        agent_.reset();
        connection_.reset();
    }

    void registerAgent(const std::string& path, const std::string& capability)
    {
        call([&]() {
            bluez_->callMethod("RegisterAgent")
                .onInterface(kAgentManagerInterface.data())
                .withTimeout(callTimeout_)
                .withArguments(sdbus::ObjectPath{path}, capability);
        });
    }

    void requestDefaultAgent(const std::string& path)
    {
        call([&]() {
            bluez_->callMethod("RequestDefaultAgent")
                .onInterface(kAgentManagerInterface.data())
                .withTimeout(callTimeout_)
                .withArguments(sdbus::ObjectPath{path});
        });
    }

    void unregisterAgent(const std::string& path)
    {
        call([&]() {
            bluez_->callMethod("UnregisterAgent")
                .onInterface(kAgentManagerInterface.data())
                .withTimeout(callTimeout_)
                .withArguments(sdbus::ObjectPath{path});
        });
    }

    void registerProfile(const std::string& path, const std::string& uuid, const ProfileOptions& options)
    {
        std::map<std::string, sdbus::Variant> dict;
        dict.insert({"Name", options.name});
        dict.insert({"Role", options.role});
        dict.insert({"RequireAuthentication", options.requireAuthentication});
        dict.insert({"RequireAuthorization", options.requireAuthorization});
        dict.insert({"AutoConnect", options.autoConnect});
        dict.insert({"ServiceRecord", options.serviceRecord});

        call([&]() {
            bluez_->callMethod("RegisterProfile")
                .onInterface(kProfileManagerInterface.data())
                .withTimeout(callTimeout_)
                .withArguments(sdbus::ObjectPath{path}, uuid, dict);
        });
    }

    void unregisterProfile(const std::string& path)
    {
        call([&]() {
            bluez_->callMethod("UnregisterProfile")
                .onInterface(kProfileManagerInterface.data())
                .withTimeout(callTimeout_)
                .withArguments(sdbus::ObjectPath{path});
        });
    }

private:
    template <typename Fn>
    void call(Fn&& fn)
    {
        try {
            fn();
        } catch (const sdbus::Error& ex) {
            rethrowAsBusError(ex);
        }
    }

    std::chrono::microseconds callTimeout_;
    std::unique_ptr<sdbus::IConnection> connection_;
    std::unique_ptr<PairingAgent> agent_;
    std::unique_ptr<HidProfile> profile_;
    std::unique_ptr<sdbus::IProxy> bluez_;
    std::thread eventThread_;
};

SdbusBluez::SdbusBluez(const ServiceIdentity& identity, const BusConfig& config)
    : impl_(std::make_unique<Impl>(identity, config))
{
}

SdbusBluez::~SdbusBluez() = default;

void SdbusBluez::registerAgent(const std::string& path, const std::string& capability)
{
    impl_->registerAgent(path, capability);
}

void SdbusBluez::requestDefaultAgent(const std::string& path)
{
    impl_->requestDefaultAgent(path);
}

void SdbusBluez::unregisterAgent(const std::string& path)
{
    impl_->unregisterAgent(path);
}

void SdbusBluez::registerProfile(const std::string& path, const std::string& uuid, const ProfileOptions& options)
{
    impl_->registerProfile(path, uuid, options);
}

void SdbusBluez::unregisterProfile(const std::string& path)
{
    impl_->unregisterProfile(path);
}

SdbusConnector::SdbusConnector(ServiceIdentity identity, BusConfig config)
    : identity_(std::move(identity))
    , config_(config)
{
}

std::unique_ptr<BluezBus> SdbusConnector::open()
{
    return std::make_unique<SdbusBluez>(identity_, config_);
}
