#pragma once

#include "control_surface.hpp"
#include "service_config.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Runs `bluetoothctl <command words>` once per call with stdout captured.
class BluetoothctlControlSurface : public ControlSurface {
public:
    explicit BluetoothctlControlSurface(AdapterControlConfig config);

    std::optional<std::string> run(const std::string& command, std::chrono::milliseconds timeout) override;
    bool restartService(std::chrono::milliseconds timeout) override;

private:
    AdapterControlConfig config_;
};

struct ProcessResult {
    std::string output;
    int exitStatus{-1};
};

// Forks and execs argv[0] from PATH, merging stdout and stderr. A child
// still running at the deadline is killed and nullopt returned.
std::optional<ProcessResult> runProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

std::vector<std::string> splitCommandLine(const std::string& command);
