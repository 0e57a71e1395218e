#pragma once

#include <atomic>
#include <chrono>

// Stop request shared between signal handlers and the sampling loop. The
// handler only stores a flag and writes one byte to a self-pipe.
class ShutdownSignal {
public:
    ShutdownSignal();
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    // Routes SIGINT and SIGTERM to this instance.
    void installHandlers();

    void requestStop() noexcept;
    [[nodiscard]] bool stopRequested() const noexcept;

    // Sleeps up to `duration`; returns early with true once a stop is requested.
    bool waitFor(std::chrono::milliseconds duration);

private:
    std::atomic<bool> stop_{false};
    int readFd_{-1};
    int writeFd_{-1};
};
