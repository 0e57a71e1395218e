#include "l2cap_hid_transport.hpp"

#include <bluetooth/bluetooth.h>
#include <bluetooth/l2cap.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

int createListenSocket(uint16_t psm)
{
    int fd = ::socket(AF_BLUETOOTH, SOCK_SEQPACKET | SOCK_NONBLOCK | SOCK_CLOEXEC, BTPROTO_L2CAP);
    if (fd < 0) {
        throw std::runtime_error(std::string("Unable to create L2CAP socket: ") + std::strerror(errno));
    }

    sockaddr_l2 addr{};
    addr.l2_family = AF_BLUETOOTH;
    bdaddr_t any = {{0, 0, 0, 0, 0, 0}};
    addr.l2_bdaddr = any;
    addr.l2_psm = htobs(psm);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        ::close(fd);
        throw std::runtime_error("Failed to bind L2CAP PSM " + std::to_string(psm) + ": " + std::strerror(err));
    }

    if (::listen(fd, 1) < 0) {
        const int err = errno;
        ::close(fd);
        throw std::runtime_error("Failed to listen on L2CAP PSM " + std::to_string(psm) + ": " + std::strerror(err));
    }

    return fd;
}

void closeFd(int& fd)
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool readable(int fd)
{
    if (fd < 0) {
        return false;
    }
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

} // namespace

L2capHidTransport::L2capHidTransport(TransportConfig config)
    : config_(std::move(config))
{
}

L2capHidTransport::~L2capHidTransport()
{
    stop();
}

void L2capHidTransport::start()
{
    if (controlListenFd_ >= 0) {
        return;
    }

    controlListenFd_ = createListenSocket(config_.controlPsm);
    try {
        interruptListenFd_ = createListenSocket(config_.interruptPsm);
    } catch (...) {
        closeFd(controlListenFd_);
        throw;
    }
    std::cout << "[btmouse] Listening for HID hosts on PSM " << config_.controlPsm << "/" << config_.interruptPsm << std::endl;
}

void L2capHidTransport::stop() noexcept
{
    resetConnection();
    closeFd(controlListenFd_);
    closeFd(interruptListenFd_);
}

void L2capHidTransport::service()
{
    acceptPending(controlListenFd_, controlClientFd_, "control");
    acceptPending(interruptListenFd_, interruptClientFd_, "interrupt");
    drainControl();
}

bool L2capHidTransport::connected() const
{
    return controlClientFd_ >= 0 && interruptClientFd_ >= 0;
}

bool L2capHidTransport::send(const HIDReport& report)
{
    if (!connected()) {
        return false;
    }

    const auto frame = frameInputReport(report);
    const ssize_t written = ::send(interruptClientFd_, frame.data(), frame.size(), MSG_DONTWAIT | MSG_NOSIGNAL);
    if (written < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return false;
        }
        std::cerr << "[btmouse] Failed to send interrupt report: " << std::strerror(errno) << std::endl;
        resetConnection();
        return false;
    }
    channelState_.lastReport = report;
    return true;
}

void L2capHidTransport::acceptPending(int listenFd, int& clientFd, const char* channel)
{
    if (!readable(listenFd)) {
        return;
    }

    sockaddr_l2 addr{};
    socklen_t len = sizeof(addr);
    const int client = ::accept4(listenFd, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::cerr << "[btmouse] accept on " << channel << " channel failed: " << std::strerror(errno) << std::endl;
        }
        return;
    }

    char address[18] = {0};
    ba2str(&addr.l2_bdaddr, address);
    std::cout << "[btmouse] Host " << address << " connected " << channel << " channel" << std::endl;

    closeFd(clientFd);
    clientFd = client;
    if (connected()) {
        channelState_ = HidpChannelState{};
    }
}

void L2capHidTransport::drainControl()
{
    uint8_t buffer[128];
    while (controlClientFd_ >= 0) {
        const ssize_t received = ::recv(controlClientFd_, buffer, sizeof(buffer), MSG_DONTWAIT);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                return;
            }
            std::cerr << "[btmouse] Control channel error: " << std::strerror(errno) << std::endl;
            resetConnection();
            return;
        }
        if (received == 0) {
            std::cout << "[btmouse] Host closed the control channel" << std::endl;
            resetConnection();
            return;
        }

        auto result = handleHidpControlMessage(buffer, static_cast<std::size_t>(received), channelState_);
        if (!result.response.empty()) {
            if (::send(controlClientFd_, result.response.data(), result.response.size(), MSG_DONTWAIT | MSG_NOSIGNAL) < 0) {
                std::cerr << "[btmouse] Failed to answer control request: " << std::strerror(errno) << std::endl;
            }
        }
        if (result.disconnect) {
            std::cout << "[btmouse] Virtual cable unplugged by host" << std::endl;
            resetConnection();
            return;
        }
    }
}

void L2capHidTransport::resetConnection()
{
    closeFd(controlClientFd_);
    closeFd(interruptClientFd_);
    channelState_ = HidpChannelState{};
}
