#pragma once

#include "hid_report.hpp"

// Delivers input reports to a paired host.
class ReportTransport {
public:
    virtual ~ReportTransport() = default;

    virtual void start() = 0;
    virtual void stop() noexcept = 0;

    // Accepts pending connections and answers control traffic. Must not block.
    virtual void service() = 0;

    [[nodiscard]] virtual bool connected() const = 0;

    // False when the report could not be delivered; the connection is dropped.
    virtual bool send(const HIDReport& report) = 0;
};
