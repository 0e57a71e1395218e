#pragma once

#include "control_surface.hpp"
#include "service_config.hpp"

#include <chrono>
#include <functional>
#include <string>

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper threadSleeper();

struct AdapterState {
    bool powered{false};
    bool discoverable{false};
    bool pairable{false};
    bool controllerPresent{false};
};

// Interprets `show` output: "Controller", "Powered: no", "Discoverable: no",
// "Pairable: no". Without a controller every flag reads false.
AdapterState parseAdapterState(const std::string& showOutput);

class AdapterProber {
public:
    AdapterProber(ControlSurface& control, AdapterControlConfig config, Sleeper sleeper);

    // Live state; a timed out query reads as no controller.
    AdapterState probe();

    // Repairs power, discoverable and pairable from live state, always
    // re-enables the agent. Throws AdapterError if no controller is
    // present afterwards.
    void ensureReady();

    // Restarts the daemon and waits for it to settle.
    void restartService();

private:
    bool invoke(const std::string& command);

    ControlSurface& control_;
    AdapterControlConfig config_;
    Sleeper sleeper_;
};
