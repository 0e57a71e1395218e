#pragma once

#include <array>
#include <cstdint>

enum class MouseButton {
    Left,
    Right,
    Middle
};

struct PointerPosition {
    int x{0};
    int y{0};
};

struct ButtonState {
    bool left{false};
    bool middle{false};
    bool right{false};
};

struct PointerSample {
    PointerPosition position;
    ButtonState buttons;
};

// One input report as declared by kMouseReportDescriptor.
struct HIDReport {
    uint8_t buttonMask{0};
    int8_t dx{0};
    int8_t dy{0};

    [[nodiscard]] bool isIdle() const noexcept { return buttonMask == 0 && dx == 0 && dy == 0; }
    [[nodiscard]] std::array<uint8_t, 3> bytes() const noexcept;
};

bool operator==(const HIDReport& lhs, const HIDReport& rhs) noexcept;
bool operator!=(const HIDReport& lhs, const HIDReport& rhs) noexcept;

constexpr int kMaxAxisDelta = 127;

// Generic Desktop / Mouse: 3 buttons + 5 bits padding, relative X and Y
// as signed 8-bit. No report ID.
constexpr std::array<uint8_t, 50> kMouseReportDescriptor{
    0x05, 0x01,       // Usage Page (Generic Desktop)
    0x09, 0x02,       // Usage (Mouse)
    0xA1, 0x01,       // Collection (Application)
    0x09, 0x01,       //   Usage (Pointer)
    0xA1, 0x00,       //   Collection (Physical)
    0x05, 0x09,       //     Usage Page (Buttons)
    0x19, 0x01,       //     Usage Minimum (1)
    0x29, 0x03,       //     Usage Maximum (3)
    0x15, 0x00,       //     Logical Minimum (0)
    0x25, 0x01,       //     Logical Maximum (1)
    0x95, 0x03,       //     Report Count (3)
    0x75, 0x01,       //     Report Size (1)
    0x81, 0x02,       //     Input (Data, Var, Abs)
    0x95, 0x01,       //     Report Count (1)
    0x75, 0x05,       //     Report Size (5)
    0x81, 0x01,       //     Input (Const)
    0x05, 0x01,       //     Usage Page (Generic Desktop)
    0x09, 0x30,       //     Usage (X)
    0x09, 0x31,       //     Usage (Y)
    0x15, 0x81,       //     Logical Minimum (-127)
    0x25, 0x7F,       //     Logical Maximum (127)
    0x75, 0x08,       //     Report Size (8)
    0x95, 0x02,       //     Report Count (2)
    0x81, 0x06,       //     Input (Data, Var, Rel)
    0xC0,             //   End Collection
    0xC0              // End Collection
};

uint8_t mouseButtonMask(MouseButton button);
uint8_t mouseButtonMask(const ButtonState& buttons);

// Saturates to [-127, 127].
int8_t clampAxisDelta(long long delta);

HIDReport encodeMouseReport(const PointerPosition& previous, const PointerPosition& current, const ButtonState& buttons);
HIDReport encodeMouseReport(const PointerSample& previous, const PointerSample& current);

HIDReport decodeMouseReport(const std::array<uint8_t, 3>& bytes);
