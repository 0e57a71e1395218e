#include <catch2/catch.hpp>

#include "hid_report.hpp"

#include <algorithm>
#include <climits>

namespace {

ButtonState buttons(bool left, bool middle, bool right)
{
    ButtonState state;
    state.left = left;
    state.middle = middle;
    state.right = right;
    return state;
}

} // namespace

TEST_CASE("Report descriptor declares a 3-button relative mouse", "[codec][descriptor]")
{
    REQUIRE(kMouseReportDescriptor.size() == 50);
    REQUIRE(kMouseReportDescriptor[0] == 0x05);
    REQUIRE(kMouseReportDescriptor[3] == 0x02); // Usage (Mouse)
    REQUIRE(kMouseReportDescriptor[39] == 0x81); // Logical Minimum (-127)
    REQUIRE(kMouseReportDescriptor[41] == 0x7F);
    REQUIRE(kMouseReportDescriptor[48] == 0xC0);
    REQUIRE(kMouseReportDescriptor[49] == 0xC0);
}

TEST_CASE("Deltas beyond the axis range saturate instead of wrapping", "[codec][clamp]")
{
    const PointerPosition origin{0, 0};

    REQUIRE(encodeMouseReport(origin, {128, 0}, {}).dx == 127);
    REQUIRE(encodeMouseReport(origin, {1000, 0}, {}).dx == 127);
    REQUIRE(encodeMouseReport(origin, {-128, 0}, {}).dx == -127);
    REQUIRE(encodeMouseReport(origin, {-5000, 0}, {}).dx == -127);
    REQUIRE(encodeMouseReport(origin, {0, 300}, {}).dy == 127);
    REQUIRE(encodeMouseReport(origin, {0, -300}, {}).dy == -127);

    // 256 would wrap to 0 without clamping
    REQUIRE(encodeMouseReport(origin, {256, -256}, {}).dx == 127);
    REQUIRE(encodeMouseReport(origin, {256, -256}, {}).dy == -127);

    // in-range deltas pass through
    REQUIRE(encodeMouseReport({10, 10}, {137, -107}, {}).dx == 127);
    REQUIRE(encodeMouseReport({10, 10}, {137, -107}, {}).dy == -117);
}

TEST_CASE("Extreme coordinates do not overflow the delta", "[codec][clamp]")
{
    const auto report = encodeMouseReport({INT_MIN, INT_MAX}, {INT_MAX, INT_MIN}, {});
    REQUIRE(report.dx == 127);
    REQUIRE(report.dy == -127);
}

TEST_CASE("Button mask packs left, right, middle into bits 0..2", "[codec][buttons]")
{
    for (int bits = 0; bits < 8; ++bits) {
        const bool left = bits & 0x01;
        const bool middle = bits & 0x02;
        const bool right = bits & 0x04;
        const auto report = encodeMouseReport({0, 0}, {0, 0}, buttons(left, middle, right));
        const uint8_t expected = static_cast<uint8_t>((left ? 1 : 0) | ((right ? 1 : 0) << 1) | ((middle ? 1 : 0) << 2));
        REQUIRE(report.buttonMask == expected);
        REQUIRE((report.buttonMask & 0xF8) == 0);
    }

    REQUIRE(mouseButtonMask(MouseButton::Left) == 0x01);
    REQUIRE(mouseButtonMask(MouseButton::Right) == 0x02);
    REQUIRE(mouseButtonMask(MouseButton::Middle) == 0x04);
}

TEST_CASE("Report bytes decode back to the clamped deltas", "[codec][decode]")
{
    const int deltas[] = {-400, -128, -127, -1, 0, 1, 42, 127, 128, 999};
    for (int dx : deltas) {
        for (int dy : deltas) {
            const auto report = encodeMouseReport({0, 0}, {dx, dy}, buttons(true, false, true));
            const auto decoded = decodeMouseReport(report.bytes());
            REQUIRE(decoded == report);
            REQUIRE(static_cast<int>(decoded.dx) == std::max(-127, std::min(127, dx)));
            REQUIRE(static_cast<int>(decoded.dy) == std::max(-127, std::min(127, dy)));
        }
    }
}

TEST_CASE("Left drag from (100,100) to (250,80) encodes as 01 7F EC", "[codec][drag]")
{
    PointerSample previous;
    previous.position = {100, 100};
    PointerSample current;
    current.position = {250, 80};
    current.buttons.left = true;

    const auto bytes = encodeMouseReport(previous, current).bytes();
    REQUIRE(bytes[0] == 0x01);
    REQUIRE(bytes[1] == 0x7F);
    REQUIRE(bytes[2] == 0xEC);
}

TEST_CASE("Idle report has no buttons and no motion", "[codec]")
{
    REQUIRE(encodeMouseReport({5, 5}, {5, 5}, {}).isIdle());
    REQUIRE_FALSE(encodeMouseReport({5, 5}, {5, 5}, buttons(false, true, false)).isIdle());
    REQUIRE_FALSE(encodeMouseReport({5, 5}, {6, 5}, {}).isIdle());
}
