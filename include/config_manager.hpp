#pragma once
#include <stdint.h>
#include <vector>
#include <string>

struct LoggingConfig {
    std::string log_level;
};

struct WifiConfig {
    std::string ssid;
    std::string password;
    uint32_t reconnect_interval_ms;
};

struct TransportConfig {
    uint16_t port;
    uint32_t timeout_ms;
};

struct PollingConfig {
    uint32_t default_interval_ms;   // 0: use the device profile's default
    uint32_t min_interval_ms;
    uint32_t max_interval_ms;
};

// One device the gateway should poll, as persisted by the console.
struct DeviceEntry {
    std::string name;
    std::string ip;
    std::string mac;
    std::string type;
    uint32_t cfg;
    uint32_t poll_interval_s;   // 0: default
};

// Poll interval bounds check shared by the config loader and device setup.
bool validatePollInterval(const PollingConfig& rules, uint32_t interval_ms, std::string& reason);

// Per-exchange response deadline accepted from the config file.
const uint32_t MIN_EXCHANGE_TIMEOUT_MS = 100;
const uint32_t MAX_EXCHANGE_TIMEOUT_MS = 10000;
bool validateExchangeTimeout(uint32_t timeout_ms, std::string& reason);

class ConfigManager {
public:
    ConfigManager(const char* config_file = "/config/gateway.json");
    ~ConfigManager();

    // Reads the config file from LittleFS; keeps defaults on any failure.
    bool load();
    // Parses a JSON document on top of the current values.
    bool loadFromJson(const char* json, std::string& error);
    bool save() const;
    std::string toJson() const;

    LoggingConfig getLoggingConfig() const;
    WifiConfig getWifiConfig() const;
    TransportConfig getTransportConfig() const;
    PollingConfig getPollingConfig() const;
    std::vector<DeviceEntry> getDevices() const;

    // Adds or replaces (same MAC) a device entry.
    bool upsertDevice(const DeviceEntry& entry, std::string& reason);
    bool removeDevice(const std::string& mac);

private:
    std::string config_file_;
    LoggingConfig logging_config_;
    WifiConfig wifi_config_;
    TransportConfig transport_config_;
    PollingConfig polling_config_;
    std::vector<DeviceEntry> devices_;

    void initializeDefaults();
};
