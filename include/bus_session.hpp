#pragma once

#include "adapter_prober.hpp"
#include "bluez_bus.hpp"
#include "service_config.hpp"

#include <memory>

class BusSessionManager {
public:
    BusSessionManager(BusConnector& connector, AdapterProber& prober, RetryPolicy policy, Sleeper sleeper);

    // Throws ConnectionError once every attempt has failed.
    std::unique_ptr<BluezBus> connect();

private:
    BusConnector& connector_;
    AdapterProber& prober_;
    RetryPolicy policy_;
    Sleeper sleeper_;
};
