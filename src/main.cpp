#include "bluetoothctl_control_surface.hpp"
#include "evdev_pointer_source.hpp"
#include "l2cap_hid_transport.hpp"
#include "mouse_service.hpp"
#include "sdbus_bluez.hpp"
#include "service_config.hpp"
#include "service_identity.hpp"
#include "shutdown_signal.hpp"

#include <exception>
#include <iostream>
#include <memory>

int main(int argc, char** argv)
{
    (void)argc;
    (void)argv;

    try {
        auto config = loadServiceConfigFromEnvironment();
        auto identity = generateServiceIdentity(config.identity);

        ShutdownSignal shutdown;
        shutdown.installHandlers();

        BluetoothctlControlSurface control(config.adapterControl);
        SdbusConnector connector(identity, config.bus);
        EvdevPointerSource pointer(config.sampling);

        std::unique_ptr<L2capHidTransport> transport;
        if (config.transport.enabled) {
            transport = std::make_unique<L2capHidTransport>(config.transport);
        }

        // setup delays end early on SIGINT/SIGTERM
        Sleeper sleeper = [&shutdown](std::chrono::milliseconds duration) { shutdown.waitFor(duration); };

        MouseService service(config, identity, ServiceCollaborators{control, connector, pointer, transport.get(), sleeper});
        return service.run(shutdown);
    } catch (const std::exception& ex) {
        std::cerr << "[btmouse] Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
