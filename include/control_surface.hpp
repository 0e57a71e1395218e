#pragma once

#include <chrono>
#include <optional>
#include <string>

// Adapter-configuration tool driven with one command per invocation
// ("show", "power on", "discoverable on", "pairable on", "agent on").
// Output is free text; callers match on substrings only.
class ControlSurface {
public:
    virtual ~ControlSurface() = default;

    // Returns the command's output, or nullopt when it did not finish in time.
    virtual std::optional<std::string> run(const std::string& command, std::chrono::milliseconds timeout) = 0;

    // Restarts the Bluetooth daemon. False when the restart did not complete.
    virtual bool restartService(std::chrono::milliseconds timeout) = 0;
};
