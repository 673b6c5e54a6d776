#pragma once
#include <string>
#include <cstdint>
#include "config_manager.hpp"

class WiFiConnector {
public:
    explicit WiFiConnector(const WifiConfig& cfg);
    ~WiFiConnector();

    void begin();
    // Non-blocking loop; will attempt reconnects periodically
    void loop();
    bool isConnected() const;
    std::string localIp() const;

private:
    std::string ssid_;
    std::string password_;
    uint32_t lastAttemptMs_ = 0;
    uint32_t reconnectIntervalMs_ = 10000;
    bool wasConnected_ = false;
};
