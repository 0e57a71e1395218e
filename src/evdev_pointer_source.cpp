#include "evdev_pointer_source.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <fcntl.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {

constexpr std::size_t kBitsPerLong = sizeof(unsigned long) * CHAR_BIT;

bool testBit(const unsigned long* bits, unsigned bit)
{
    return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

bool isRelativePointer(int fd)
{
    unsigned long evBits[(EV_MAX / kBitsPerLong) + 1] = {0};
    unsigned long relBits[(REL_MAX / kBitsPerLong) + 1] = {0};
    if (::ioctl(fd, EVIOCGBIT(0, sizeof(evBits)), evBits) < 0 || !testBit(evBits, EV_REL)) {
        return false;
    }
    if (::ioctl(fd, EVIOCGBIT(EV_REL, sizeof(relBits)), relBits) < 0) {
        return false;
    }
    return testBit(relBits, REL_X) && testBit(relBits, REL_Y);
}

int saturatingAdd(int lhs, int rhs)
{
    const long long sum = static_cast<long long>(lhs) + rhs;
    return static_cast<int>(std::clamp<long long>(sum, INT_MIN, INT_MAX));
}

} // namespace

EvdevPointerSource::EvdevPointerSource(const SamplingConfig& config)
    : grab_(config.grab)
{
    if (config.inputDevice != "auto") {
        if (!openDevice(config.inputDevice)) {
            throw std::runtime_error("Input device " + config.inputDevice + " is not a usable relative pointer");
        }
        return;
    }

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/dev/input", ec)) {
        const auto name = entry.path().filename().string();
        if (name.rfind("event", 0) == 0) {
            openDevice(entry.path().string());
        }
    }
    if (fds_.empty()) {
        throw std::runtime_error("No relative pointer device found under /dev/input (are you in the 'input' group?)");
    }
}

EvdevPointerSource::~EvdevPointerSource()
{
    for (int fd : fds_) {
        if (fd >= 0) {
            if (grab_) {
                ::ioctl(fd, EVIOCGRAB, 0);
            }
            ::close(fd);
        }
    }
}

PointerSample EvdevPointerSource::sample()
{
    for (auto& fd : fds_) {
        drain(fd);
    }
    fds_.erase(std::remove(fds_.begin(), fds_.end(), -1), fds_.end());
    return state_;
}

bool EvdevPointerSource::openDevice(const std::string& path)
{
    const int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }

    if (!isRelativePointer(fd)) {
        ::close(fd);
        return false;
    }

    char name[256] = "Unknown";
    ::ioctl(fd, EVIOCGNAME(sizeof(name)), name);

    if (grab_ && ::ioctl(fd, EVIOCGRAB, 1) < 0) {
        std::cerr << "[btmouse] Could not grab " << path << ": " << std::strerror(errno) << std::endl;
    }

    std::cout << "[btmouse] Reading pointer " << path << " (" << name << ")" << std::endl;
    fds_.push_back(fd);
    return true;
}

void EvdevPointerSource::drain(int& fd)
{
    input_event ev{};
    while (true) {
        const ssize_t received = ::read(fd, &ev, sizeof(ev));
        if (received < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                return;
            }
            std::cerr << "[btmouse] Pointer device lost: " << std::strerror(errno) << std::endl;
            ::close(fd);
            fd = -1;
            return;
        }
        if (received != static_cast<ssize_t>(sizeof(ev))) {
            return;
        }

        if (ev.type == EV_REL) {
            if (ev.code == REL_X) {
                state_.position.x = saturatingAdd(state_.position.x, ev.value);
            } else if (ev.code == REL_Y) {
                state_.position.y = saturatingAdd(state_.position.y, ev.value);
            }
        } else if (ev.type == EV_KEY) {
            const bool pressed = ev.value != 0;
            switch (ev.code) {
            case BTN_LEFT:
                state_.buttons.left = pressed;
                break;
            case BTN_RIGHT:
                state_.buttons.right = pressed;
                break;
            case BTN_MIDDLE:
                state_.buttons.middle = pressed;
                break;
            default:
                break;
            }
        }
    }
}
