#include "../include/wifi_connector.hpp"
#include "../include/logger.hpp"

#include <Arduino.h>
#include <WiFi.h>

WiFiConnector::WiFiConnector(const WifiConfig& cfg)
    : ssid_(cfg.ssid), password_(cfg.password) {
    if (cfg.reconnect_interval_ms > 0) reconnectIntervalMs_ = cfg.reconnect_interval_ms;
}
WiFiConnector::~WiFiConnector() {}

void WiFiConnector::begin() {
    if (ssid_.empty()) {
        Logger::warn("WiFiConnector: No SSID configured, devices will stay unavailable");
        return;
    }
    Logger::info("WiFiConnector: Connecting to SSID: %s", ssid_.c_str());
    WiFi.mode(WIFI_STA);
    WiFi.setAutoReconnect(true);
    WiFi.begin(ssid_.c_str(), password_.c_str());
    lastAttemptMs_ = millis();
}

void WiFiConnector::loop() {
    if (ssid_.empty()) return;
    bool connected = WiFi.status() == WL_CONNECTED;
    if (connected != wasConnected_) {
        wasConnected_ = connected;
        if (connected) {
            Logger::info("WiFiConnector: Connected, IP %s", localIp().c_str());
        } else {
            Logger::warn("WiFiConnector: Connection to %s lost", ssid_.c_str());
        }
    }
    if (connected) return;
    unsigned long now = millis();
    if (now - lastAttemptMs_ >= reconnectIntervalMs_) {
        Logger::info("WiFiConnector: Attempting reconnect to %s", ssid_.c_str());
        WiFi.disconnect();
        WiFi.begin(ssid_.c_str(), password_.c_str());
        lastAttemptMs_ = now;
    }
}

bool WiFiConnector::isConnected() const {
    return WiFi.status() == WL_CONNECTED;
}

std::string WiFiConnector::localIp() const {
    return std::string(WiFi.localIP().toString().c_str());
}
