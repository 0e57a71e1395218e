#include "bus_session.hpp"

#include "errors.hpp"

#include <iostream>
#include <string>
#include <utility>

BusSessionManager::BusSessionManager(BusConnector& connector, AdapterProber& prober, RetryPolicy policy, Sleeper sleeper)
    : connector_(connector)
    , prober_(prober)
    , policy_(policy)
    , sleeper_(std::move(sleeper))
{
}

std::unique_ptr<BluezBus> BusSessionManager::connect()
{
    std::string lastError;
    for (unsigned attempt = 1; attempt <= policy_.maxAttempts; ++attempt) {
        try {
            auto bus = connector_.open();
            if (attempt > 1) {
                std::cout << "[btmouse] Connected to system bus on attempt " << attempt << std::endl;
            }
            return bus;
        } catch (const BusError& ex) {
            lastError = ex.what();
            std::cerr << "[btmouse] Bus connection attempt " << attempt << "/" << policy_.maxAttempts
                      << " failed: " << lastError << std::endl;
            if (attempt == policy_.maxAttempts) {
                break;
            }
            if (ex.name() == kErrorServiceUnknown) {
                prober_.restartService();
            } else {
                sleeper_(policy_.delay);
            }
        }
    }
    throw ConnectionError("Unable to connect to the Bluetooth daemon: " + lastError, policy_.maxAttempts);
}
