#include "hidp_protocol.hpp"

namespace {

HidpControlResult handshake(uint8_t result)
{
    HidpControlResult out;
    out.response.push_back(static_cast<uint8_t>(kHidpTypeHandshake | result));
    return out;
}

} // namespace

std::array<uint8_t, 4> frameInputReport(const HIDReport& report)
{
    const auto bytes = report.bytes();
    return {static_cast<uint8_t>(kHidpTypeData | kHidpReportTypeInput), bytes[0], bytes[1], bytes[2]};
}

HidpControlResult handleHidpControlMessage(const uint8_t* data, std::size_t length, HidpChannelState& state)
{
    if (length == 0) {
        return {};
    }

    const uint8_t header = data[0];
    const uint8_t type = header & 0xF0;
    const uint8_t param = header & 0x0F;

    switch (type) {
    case kHidpTypeHandshake:
        // host acknowledging a previous message
        return {};
    case kHidpTypeControl: {
        HidpControlResult out;
        out.disconnect = param == kHidpControlVirtualCableUnplug;
        return out;
    }
    case kHidpTypeGetReport: {
        if ((param & 0x03) != kHidpReportTypeInput) {
            return handshake(kHidpHandshakeErrInvalidParameter);
        }
        const auto frame = frameInputReport(state.lastReport);
        HidpControlResult out;
        out.response.assign(frame.begin(), frame.end());
        return out;
    }
    case kHidpTypeSetReport:
        // no output or feature reports are declared; accept and discard
        return handshake(kHidpHandshakeSuccess);
    case kHidpTypeGetProtocol: {
        HidpControlResult out;
        out.response = {static_cast<uint8_t>(kHidpTypeData | kHidpReportTypeOther), state.protocolMode};
        return out;
    }
    case kHidpTypeSetProtocol:
        state.protocolMode = param & 0x01;
        return handshake(kHidpHandshakeSuccess);
    case kHidpTypeGetIdle: {
        HidpControlResult out;
        out.response = {static_cast<uint8_t>(kHidpTypeData | kHidpReportTypeOther), state.idleRate};
        return out;
    }
    case kHidpTypeSetIdle:
        if (length < 2) {
            return handshake(kHidpHandshakeErrInvalidParameter);
        }
        state.idleRate = data[1];
        return handshake(kHidpHandshakeSuccess);
    default:
        return handshake(kHidpHandshakeErrUnsupported);
    }
}
