#include <catch2/catch.hpp>

#include "shutdown_signal.hpp"

#include <chrono>
#include <csignal>
#include <thread>

namespace {

// Puts SIGINT and SIGTERM back to their default action when a case ends.
struct DefaultDispositions {
    ~DefaultDispositions()
    {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
    }
};

} // namespace

TEST_CASE("SIGTERM requests a stop and cuts the wait short", "[shutdown][signal]")
{
    DefaultDispositions restore;
    ShutdownSignal shutdown;
    shutdown.installHandlers();

    REQUIRE(::raise(SIGTERM) == 0);
    REQUIRE(shutdown.stopRequested());

    const auto started = std::chrono::steady_clock::now();
    REQUIRE(shutdown.waitFor(std::chrono::seconds{10}));
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds{1});
}

TEST_CASE("SIGINT behaves like SIGTERM", "[shutdown][signal]")
{
    DefaultDispositions restore;
    ShutdownSignal shutdown;
    shutdown.installHandlers();

    REQUIRE(::raise(SIGINT) == 0);
    REQUIRE(shutdown.stopRequested());

    const auto started = std::chrono::steady_clock::now();
    REQUIRE(shutdown.waitFor(std::chrono::seconds{10}));
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds{1});
}

TEST_CASE("Wait without a stop runs for the full duration", "[shutdown]")
{
    ShutdownSignal shutdown;

    const auto started = std::chrono::steady_clock::now();
    REQUIRE_FALSE(shutdown.waitFor(std::chrono::milliseconds{30}));
    REQUIRE(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds{25});
    REQUIRE_FALSE(shutdown.stopRequested());
}

TEST_CASE("Stop from another thread wakes a pending wait", "[shutdown]")
{
    ShutdownSignal shutdown;

    std::thread stopper([&shutdown]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        shutdown.requestStop();
    });

    const auto started = std::chrono::steady_clock::now();
    const bool stopped = shutdown.waitFor(std::chrono::seconds{10});
    const auto elapsed = std::chrono::steady_clock::now() - started;
    stopper.join();

    REQUIRE(stopped);
    REQUIRE(elapsed < std::chrono::seconds{5});
}

TEST_CASE("Signals reach the most recently installed instance", "[shutdown][signal]")
{
    DefaultDispositions restore;
    {
        ShutdownSignal first;
        first.installHandlers();
    }
    ShutdownSignal second;
    second.installHandlers();

    REQUIRE(::raise(SIGTERM) == 0);
    REQUIRE(second.stopRequested());
}
