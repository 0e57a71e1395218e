#include "shutdown_signal.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace {

std::atomic<ShutdownSignal*> activeSignal{nullptr};

void handleSignal(int)
{
    if (auto* signal = activeSignal.load()) {
        signal->requestStop();
    }
}

} // namespace

ShutdownSignal::ShutdownSignal()
{
    int fds[2];
    if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) < 0) {
        throw std::runtime_error(std::string("Unable to create shutdown pipe: ") + std::strerror(errno));
    }
    readFd_ = fds[0];
    writeFd_ = fds[1];
}

ShutdownSignal::~ShutdownSignal()
{
    ShutdownSignal* expected = this;
    activeSignal.compare_exchange_strong(expected, nullptr);
    ::close(readFd_);
    ::close(writeFd_);
}

void ShutdownSignal::installHandlers()
{
    activeSignal.store(this);

    struct sigaction action {};
    action.sa_handler = handleSignal;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
}

void ShutdownSignal::requestStop() noexcept
{
    if (stop_.exchange(true)) {
        return;
    }
    const int savedErrno = errno;
    const char byte = 1;
    [[maybe_unused]] auto written = ::write(writeFd_, &byte, 1);
    errno = savedErrno;
}

bool ShutdownSignal::stopRequested() const noexcept
{
    return stop_.load();
}

bool ShutdownSignal::waitFor(std::chrono::milliseconds duration)
{
    if (stop_.load()) {
        return true;
    }

    pollfd fd{};
    fd.fd = readFd_;
    fd.events = POLLIN;
    const int ret = ::poll(&fd, 1, static_cast<int>(duration.count()));
    if (ret < 0 && errno != EINTR) {
        throw std::runtime_error(std::string("poll on shutdown pipe failed: ") + std::strerror(errno));
    }
    return stop_.load();
}
