#include "adapter_prober.hpp"

#include "errors.hpp"

#include <exception>
#include <iostream>
#include <thread>
#include <utility>

Sleeper threadSleeper()
{
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

AdapterState parseAdapterState(const std::string& showOutput)
{
    AdapterState state;
    state.controllerPresent = showOutput.find("Controller") != std::string::npos;
    if (!state.controllerPresent) {
        return state;
    }
    state.powered = showOutput.find("Powered: no") == std::string::npos;
    state.discoverable = showOutput.find("Discoverable: no") == std::string::npos;
    state.pairable = showOutput.find("Pairable: no") == std::string::npos;
    return state;
}

AdapterProber::AdapterProber(ControlSurface& control, AdapterControlConfig config, Sleeper sleeper)
    : control_(control)
    , config_(std::move(config))
    , sleeper_(std::move(sleeper))
{
}

AdapterState AdapterProber::probe()
{
    const auto output = control_.run("show", config_.commandTimeout);
    if (!output) {
        std::cerr << "[btmouse] Adapter query timed out" << std::endl;
        return AdapterState{};
    }
    return parseAdapterState(*output);
}

void AdapterProber::ensureReady()
{
    auto state = probe();

    if (!state.controllerPresent) {
        std::cerr << "[btmouse] Bluetooth service not responding, restarting it" << std::endl;
        restartService();
        state = probe();
    }

    if (state.controllerPresent && !state.powered) {
        std::cout << "[btmouse] Powering on adapter" << std::endl;
        if (invoke("power on")) {
            sleeper_(config_.powerSettle);
        }
        state = probe();
    }

    if (state.controllerPresent && !state.discoverable) {
        std::cout << "[btmouse] Enabling discoverable mode" << std::endl;
        invoke("discoverable on");
    }

    if (state.controllerPresent && !state.pairable) {
        std::cout << "[btmouse] Enabling pairable mode" << std::endl;
        invoke("pairable on");
    }

    invoke("agent on");

    state = probe();
    if (!state.controllerPresent) {
        throw AdapterError("No Bluetooth controller available");
    }
    if (!state.powered) {
        throw AdapterError("Bluetooth controller is not powered");
    }
}

void AdapterProber::restartService()
{
    try {
        if (!control_.restartService(config_.commandTimeout)) {
            std::cerr << "[btmouse] Bluetooth service restart did not complete" << std::endl;
        }
    } catch (const std::exception& ex) {
        std::cerr << "[btmouse] Bluetooth service restart failed: " << ex.what() << std::endl;
    }
    sleeper_(config_.restartSettle);
}

bool AdapterProber::invoke(const std::string& command)
{
    if (!control_.run(command, config_.commandTimeout)) {
        std::cerr << "[btmouse] Adapter command '" << command << "' timed out" << std::endl;
        return false;
    }
    return true;
}
