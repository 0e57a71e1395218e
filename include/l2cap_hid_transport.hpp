#pragma once

#include "hidp_protocol.hpp"
#include "report_transport.hpp"
#include "service_config.hpp"

// HIDP over the L2CAP control and interrupt channels advertised in the
// SDP record. All sockets are non-blocking; service() is called from the
// sampling loop.
class L2capHidTransport : public ReportTransport {
public:
    explicit L2capHidTransport(TransportConfig config);
    ~L2capHidTransport() override;

    L2capHidTransport(const L2capHidTransport&) = delete;
    L2capHidTransport& operator=(const L2capHidTransport&) = delete;

    void start() override;
    void stop() noexcept override;
    void service() override;
    bool connected() const override;
    bool send(const HIDReport& report) override;

private:
    void acceptPending(int listenFd, int& clientFd, const char* channel);
    void drainControl();
    void resetConnection();

    TransportConfig config_;
    int controlListenFd_{-1};
    int interruptListenFd_{-1};
    int controlClientFd_{-1};
    int interruptClientFd_{-1};
    HidpChannelState channelState_;
};
