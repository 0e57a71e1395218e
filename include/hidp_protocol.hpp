#pragma once

#include "hid_report.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

constexpr uint8_t kHidpTypeHandshake = 0x00;
constexpr uint8_t kHidpTypeControl = 0x10;
constexpr uint8_t kHidpTypeGetReport = 0x40;
constexpr uint8_t kHidpTypeSetReport = 0x50;
constexpr uint8_t kHidpTypeGetProtocol = 0x60;
constexpr uint8_t kHidpTypeSetProtocol = 0x70;
constexpr uint8_t kHidpTypeGetIdle = 0x80;
constexpr uint8_t kHidpTypeSetIdle = 0x90;
constexpr uint8_t kHidpTypeData = 0xA0;

constexpr uint8_t kHidpReportTypeOther = 0x00;
constexpr uint8_t kHidpReportTypeInput = 0x01;
constexpr uint8_t kHidpReportTypeOutput = 0x02;
constexpr uint8_t kHidpReportTypeFeature = 0x03;

constexpr uint8_t kHidpHandshakeSuccess = 0x00;
constexpr uint8_t kHidpHandshakeErrInvalidParameter = 0x04;
constexpr uint8_t kHidpHandshakeErrUnsupported = 0x03;

constexpr uint8_t kHidpControlVirtualCableUnplug = 0x05;

constexpr uint8_t kHidpProtocolBoot = 0x00;
constexpr uint8_t kHidpProtocolReport = 0x01;

struct HidpChannelState {
    uint8_t protocolMode{kHidpProtocolReport};
    uint8_t idleRate{0};
    HIDReport lastReport;
};

struct HidpControlResult {
    std::vector<uint8_t> response;
    bool disconnect{false};
};

// DATA|INPUT header followed by the report. The descriptor matches the
// boot mouse layout, so the frame is the same in both protocol modes.
std::array<uint8_t, 4> frameInputReport(const HIDReport& report);

HidpControlResult handleHidpControlMessage(const uint8_t* data, std::size_t length, HidpChannelState& state);
