#pragma once
#include <stdint.h>
#include <string>
#include "config_manager.hpp"
#include "device_manager.hpp"
#include "wifi_connector.hpp"

// Firmware composition root: config, WiFi, and the devices listed in the
// config file. State changes are printed on the console as JSON lines.
class SihasGateway {
public:
    SihasGateway();
    ~SihasGateway();

    void setup();
    void loop();

    // Console operations, addressed by MAC.
    bool addDevice(const DeviceEntry& entry, bool persist);
    bool removeDevice(const std::string& mac);
    bool writeChannel(const std::string& mac, const std::string& channel, const std::string& value);
    bool refreshDevice(const std::string& mac);
    bool changeHost(const std::string& mac, const std::string& host);
    void printDevices() const;
    bool printState(const std::string& mac) const;
    void printStatistics() const;

private:
    DeviceHandle handleFor(const std::string& mac) const;
    void publishState(DeviceHandle handle, const StateChange& change) const;

    ConfigManager* config_ = nullptr;
    WiFiConnector* wifi_ = nullptr;
    DeviceManager* devices_ = nullptr;
};

// "on"/"off"/numbers/labels typed on the console, read against the channel.
ChannelValue parseChannelValue(const ChannelSpec& channel, const std::string& text);
