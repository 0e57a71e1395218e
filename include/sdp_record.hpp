#pragma once

#include "service_config.hpp"
#include "service_identity.hpp"

#include <string>

// BlueZ XML service record advertising the HID mouse. Regenerated for
// every profile registration attempt.
std::string buildSdpRecord(const ServiceIdentity& identity, const DeviceConfig& device, const TransportConfig& transport);
