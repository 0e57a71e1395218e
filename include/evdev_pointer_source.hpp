#pragma once

#include "pointer_source.hpp"
#include "service_config.hpp"

#include <string>
#include <vector>

// Relative pointer devices read through evdev. Motion is integrated into
// an absolute position starting at (0, 0).
class EvdevPointerSource : public PointerSource {
public:
    // Throws std::runtime_error when no usable device can be opened.
    explicit EvdevPointerSource(const SamplingConfig& config);
    ~EvdevPointerSource() override;

    EvdevPointerSource(const EvdevPointerSource&) = delete;
    EvdevPointerSource& operator=(const EvdevPointerSource&) = delete;

    PointerSample sample() override;

private:
    bool openDevice(const std::string& path);
    void drain(int& fd);

    bool grab_;
    std::vector<int> fds_;
    PointerSample state_;
};
