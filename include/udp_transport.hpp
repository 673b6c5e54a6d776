#pragma once
#include <Arduino.h>
#include <WiFi.h>
#include <WiFiUdp.h>
#include <string>
#include "transport.hpp"
#include "modbus_frame.hpp"

// SiHAS devices answer on UDP port 502. One socket per device; it is
// opened lazily and dropped after a timeout so the next exchange starts
// from a fresh socket.
class UdpTransport : public Transport {
public:
    UdpTransport(const std::string& host, uint16_t port = SIHAS_UDP_PORT);
    ~UdpTransport();

    // Points the transport at a new address (e.g. after a DHCP change).
    bool setHost(const std::string& host) override;
    std::string getHost();

protected:
    TransportStatus doExchange(const std::vector<uint8_t>& request,
                               std::vector<uint8_t>& response,
                               uint32_t timeout_ms) override;
    void closeSocket() override;

private:
    bool openSocket();
    void discardPending();

    WiFiUDP udp_;
    IPAddress address_;
    std::string host_;
    uint16_t port_;
    bool open_ = false;

    static const uint32_t RECEIVE_POLL_MS = 2;
};
