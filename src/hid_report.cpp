#include "hid_report.hpp"

#include <algorithm>

std::array<uint8_t, 3> HIDReport::bytes() const noexcept
{
    std::array<uint8_t, 3> report{};
    report[0] = buttonMask;
    report[1] = static_cast<uint8_t>(dx);
    report[2] = static_cast<uint8_t>(dy);
    return report;
}

bool operator==(const HIDReport& lhs, const HIDReport& rhs) noexcept
{
    return lhs.buttonMask == rhs.buttonMask && lhs.dx == rhs.dx && lhs.dy == rhs.dy;
}

bool operator!=(const HIDReport& lhs, const HIDReport& rhs) noexcept
{
    return !(lhs == rhs);
}

uint8_t mouseButtonMask(MouseButton button)
{
    switch (button) {
    case MouseButton::Left:
        return 0x01;
    case MouseButton::Right:
        return 0x02;
    case MouseButton::Middle:
        return 0x04;
    }
    return 0x00;
}

uint8_t mouseButtonMask(const ButtonState& buttons)
{
    uint8_t mask = 0x00;
    if (buttons.left) {
        mask |= mouseButtonMask(MouseButton::Left);
    }
    if (buttons.right) {
        mask |= mouseButtonMask(MouseButton::Right);
    }
    if (buttons.middle) {
        mask |= mouseButtonMask(MouseButton::Middle);
    }
    return mask;
}

int8_t clampAxisDelta(long long delta)
{
    return static_cast<int8_t>(std::clamp<long long>(delta, -kMaxAxisDelta, kMaxAxisDelta));
}

HIDReport encodeMouseReport(const PointerPosition& previous, const PointerPosition& current, const ButtonState& buttons)
{
    // widen before subtracting so extreme coordinates cannot overflow
    HIDReport report;
    report.buttonMask = mouseButtonMask(buttons);
    report.dx = clampAxisDelta(static_cast<long long>(current.x) - previous.x);
    report.dy = clampAxisDelta(static_cast<long long>(current.y) - previous.y);
    return report;
}

HIDReport encodeMouseReport(const PointerSample& previous, const PointerSample& current)
{
    return encodeMouseReport(previous.position, current.position, current.buttons);
}

HIDReport decodeMouseReport(const std::array<uint8_t, 3>& bytes)
{
    HIDReport report;
    report.buttonMask = bytes[0];
    report.dx = static_cast<int8_t>(bytes[1]);
    report.dy = static_cast<int8_t>(bytes[2]);
    return report;
}
