#include <catch2/catch.hpp>

#include "adapter_prober.hpp"
#include "errors.hpp"
#include "fakes.hpp"

namespace {

AdapterControlConfig fastConfig()
{
    AdapterControlConfig config;
    config.commandTimeout = std::chrono::milliseconds{5000};
    config.restartSettle = std::chrono::milliseconds{5000};
    config.powerSettle = std::chrono::milliseconds{2000};
    return config;
}

} // namespace

TEST_CASE("Show output is parsed by substring", "[adapter][parse]")
{
    const auto ready = parseAdapterState("Controller 00:11:22:33:44:55 (public)\n\tPowered: yes\n\tDiscoverable: yes\n\tPairable: yes\n");
    REQUIRE(ready.controllerPresent);
    REQUIRE(ready.powered);
    REQUIRE(ready.discoverable);
    REQUIRE(ready.pairable);

    const auto cold = parseAdapterState("Controller 00:11:22:33:44:55 (public)\n\tPowered: no\n\tDiscoverable: no\n\tPairable: no\n");
    REQUIRE(cold.controllerPresent);
    REQUIRE_FALSE(cold.powered);
    REQUIRE_FALSE(cold.discoverable);
    REQUIRE_FALSE(cold.pairable);

    const auto missing = parseAdapterState("No default controller available\n");
    REQUIRE_FALSE(missing.controllerPresent);
    REQUIRE_FALSE(missing.powered);
}

TEST_CASE("Ready adapter only gets the agent flag", "[adapter]")
{
    SimulatedAdapter adapter;
    RecordingSleeper sleeper;
    AdapterProber prober(adapter, fastConfig(), sleeper.fn());

    prober.ensureReady();

    REQUIRE(adapter.calls == std::vector<std::string>{"show", "agent on", "show"});
    REQUIRE(sleeper.sleeps->empty());

    // safe to repeat
    prober.ensureReady();
    REQUIRE(adapter.count("agent on") == 2);
    REQUIRE(adapter.count("power on") == 0);
}

TEST_CASE("Cold adapter is powered, made discoverable and pairable", "[adapter]")
{
    SimulatedAdapter adapter;
    adapter.powered = false;
    adapter.discoverable = false;
    adapter.pairable = false;
    RecordingSleeper sleeper;
    AdapterProber prober(adapter, fastConfig(), sleeper.fn());

    prober.ensureReady();

    REQUIRE(adapter.calls == std::vector<std::string>{"show", "power on", "show", "discoverable on", "pairable on", "agent on", "show"});
    REQUIRE(*sleeper.sleeps == std::vector<std::chrono::milliseconds>{std::chrono::milliseconds{2000}});
    REQUIRE(adapter.powered);
    REQUIRE(adapter.discoverable);
    REQUIRE(adapter.pairable);
}

TEST_CASE("Unresponsive daemon is restarted before repairs", "[adapter]")
{
    SimulatedAdapter adapter;
    adapter.daemonRunning = false;
    adapter.discoverable = false;
    RecordingSleeper sleeper;
    AdapterProber prober(adapter, fastConfig(), sleeper.fn());

    prober.ensureReady();

    REQUIRE(adapter.restarts == 1);
    REQUIRE(adapter.calls.front() == "show");
    REQUIRE(adapter.calls[1] == "<restart>");
    REQUIRE(sleeper.sleeps->front() == std::chrono::milliseconds{5000});
    REQUIRE(adapter.count("discoverable on") == 1);
}

TEST_CASE("Command timeouts are not fatal", "[adapter]")
{
    SimulatedAdapter adapter;
    adapter.discoverable = false;
    adapter.hangingCommands = {"discoverable on", "agent on"};
    RecordingSleeper sleeper;
    AdapterProber prober(adapter, fastConfig(), sleeper.fn());

    REQUIRE_NOTHROW(prober.ensureReady());
    REQUIRE(adapter.count("pairable on") == 0);
    REQUIRE_FALSE(adapter.discoverable);
}

TEST_CASE("Missing controller after repairs is an AdapterError", "[adapter]")
{
    SimulatedAdapter adapter;
    adapter.controller = false;
    RecordingSleeper sleeper;
    AdapterProber prober(adapter, fastConfig(), sleeper.fn());

    REQUIRE_THROWS_AS(prober.ensureReady(), AdapterError);
    REQUIRE(adapter.restarts == 1);
    REQUIRE(adapter.count("power on") == 0);
}

TEST_CASE("Adapter that refuses power is an AdapterError", "[adapter]")
{
    SimulatedAdapter adapter;
    adapter.powered = false;
    adapter.powerOnWorks = false;
    RecordingSleeper sleeper;
    AdapterProber prober(adapter, fastConfig(), sleeper.fn());

    REQUIRE_THROWS_AS(prober.ensureReady(), AdapterError);
    REQUIRE(adapter.count("power on") == 1);
}

TEST_CASE("Timed out probe reads as no controller", "[adapter]")
{
    SimulatedAdapter adapter;
    adapter.hangingCommands = {"show"};
    AdapterProber prober(adapter, fastConfig(), RecordingSleeper{}.fn());

    const auto state = prober.probe();
    REQUIRE_FALSE(state.controllerPresent);
}
