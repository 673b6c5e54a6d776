#include <Arduino.h>
#include <ArduinoJson.h>
#include <cstdlib>
#include "../include/gateway.hpp"
#include "../include/logger.hpp"

SihasGateway::SihasGateway() {}

SihasGateway::~SihasGateway() {
    delete devices_;
    delete wifi_;
    delete config_;
}

void SihasGateway::setup() {
    config_ = new ConfigManager();
    config_->load();
    Logger::begin(config_->getLoggingConfig());

    wifi_ = new WiFiConnector(config_->getWifiConfig());
    wifi_->begin();

    devices_ = new DeviceManager(config_->getTransportConfig(), config_->getPollingConfig());
    for (const auto& entry : config_->getDevices()) {
        addDevice(entry, false);
    }
    Logger::info("[Gateway] %u devices configured", (unsigned)devices_->getDeviceCount());
}

void SihasGateway::loop() {
    wifi_->loop();
    devices_->loop();
}

DeviceHandle SihasGateway::handleFor(const std::string& mac) const {
    DeviceHandle handle = devices_->findByMac(mac);
    if (handle == INVALID_DEVICE_HANDLE) {
        Serial.printf("[CMD] No device with MAC %s\n", mac.c_str());
    }
    return handle;
}

bool SihasGateway::addDevice(const DeviceEntry& entry, bool persist) {
    DeviceAddress address;
    address.host = entry.ip;
    address.mac = entry.mac;
    address.type_tag = entry.type;
    SetupResult setup = devices_->createDevice(address, entry.cfg, entry.poll_interval_s);
    if (!setup.ok()) {
        Serial.printf("[CMD] Cannot add %s: %s (%s)\n", entry.mac.c_str(), setup.reason.c_str(),
                      errorCodeToString(setup.error));
        return false;
    }
    DeviceHandle handle = setup.handle;
    ErrorCode err = devices_->subscribe(handle, [this, handle](const StateChange& change) {
        publishState(handle, change);
    });
    if (err != ERR_NONE) return false;
    if (persist) {
        std::string reason;
        if (!config_->upsertDevice(entry, reason) || !config_->save()) {
            Logger::warn("[Gateway] Device %s added but not saved: %s", entry.mac.c_str(), reason.c_str());
        }
    }
    return true;
}

bool SihasGateway::removeDevice(const std::string& mac) {
    DeviceHandle handle = handleFor(mac);
    if (handle == INVALID_DEVICE_HANDLE) return false;
    devices_->destroy(handle);
    if (config_->removeDevice(mac)) config_->save();
    return true;
}

ChannelValue parseChannelValue(const ChannelSpec& channel, const std::string& text) {
    if (text.empty()) return ChannelValue::invalid();
    if (channel.type == ChannelType::BOOLEAN || channel.type == ChannelType::BITFIELD) {
        if (text == "on" || text == "true") return ChannelValue::fromBool(true);
        if (text == "off" || text == "false") return ChannelValue::fromBool(false);
    }
    char* end = nullptr;
    float number = strtof(text.c_str(), &end);
    if (end && *end == '\0') return ChannelValue::fromNumber(number);
    if (channel.type == ChannelType::ENUMERATION) return ChannelValue::fromLabel(text);
    return ChannelValue::invalid();
}

bool SihasGateway::writeChannel(const std::string& mac, const std::string& channel, const std::string& value) {
    DeviceHandle handle = handleFor(mac);
    if (handle == INVALID_DEVICE_HANDLE) return false;

    CapabilitySet caps;
    if (devices_->getCapabilities(handle, caps) != ERR_NONE) return false;
    // Unknown channels are reported by the dispatcher.
    const ChannelSpec* spec = caps.findChannel(channel);
    ChannelValue parsed = spec ? parseChannelValue(*spec, value) : ChannelValue::invalid();

    CommandResult result = devices_->write(handle, channel, parsed);
    if (!result.ok()) {
        Serial.printf("[CMD] SET %s failed: %s (%s) -> %s\n", channel.c_str(), errorCodeToString(result.error),
                      result.error_details.c_str(), recoveryActionToString(result.action));
        return false;
    }
    Serial.printf("[CMD] SET %s ok (register %u = %u)\n", channel.c_str(),
                  (unsigned)result.register_address, (unsigned)result.register_word);
    return true;
}

bool SihasGateway::refreshDevice(const std::string& mac) {
    DeviceHandle handle = handleFor(mac);
    if (handle == INVALID_DEVICE_HANDLE) return false;
    PollResult result;
    ErrorCode err = devices_->refresh(handle, &result);
    Serial.printf("[CMD] REFRESH: %s\n", errorCodeToString(err));
    return err == ERR_NONE;
}

bool SihasGateway::changeHost(const std::string& mac, const std::string& host) {
    DeviceHandle handle = handleFor(mac);
    if (handle == INVALID_DEVICE_HANDLE) return false;
    ErrorCode err = devices_->updateHost(handle, host);
    if (err != ERR_NONE) {
        Serial.printf("[CMD] HOST failed: %s\n", errorCodeToString(err));
        return false;
    }
    for (auto entry : config_->getDevices()) {
        if (devices_->findByMac(entry.mac) == handle) {
            std::string reason;
            entry.ip = host;
            if (config_->upsertDevice(entry, reason)) config_->save();
        }
    }
    return true;
}

void SihasGateway::printDevices() const {
    Serial.println("\n========== DEVICES ==========");
    for (DeviceHandle handle : devices_->getHandles()) {
        DeviceAddress address;
        DeviceState state;
        CapabilitySet caps;
        if (devices_->getAddress(handle, address) != ERR_NONE ||
            devices_->getState(handle, state) != ERR_NONE ||
            devices_->getCapabilities(handle, caps) != ERR_NONE) {
            continue;   // destroyed meanwhile
        }
        Serial.printf("#%lu %s %s %s cfg=%lu %s\n", (unsigned long)handle, address.type_tag.c_str(),
                      address.mac.c_str(), address.host.c_str(), (unsigned long)caps.config_code,
                      state.available ? "available" : "unavailable");
    }
    Serial.println("=============================\n");
}

static void fillStateJson(JsonObject obj, const DeviceState& state) {
    obj["available"] = state.available;
    obj["last_updated_ms"] = state.last_updated_ms;
    JsonObject values = obj.createNestedObject("values");
    for (const auto& kv : state.values) {
        const ChannelValue& v = kv.second;
        if (!v.valid) {
            values[kv.first.c_str()] = serialized("null");
        } else if (!v.label.empty()) {
            values[kv.first.c_str()] = v.label.c_str();
        } else {
            values[kv.first.c_str()] = v.number;
        }
    }
}

bool SihasGateway::printState(const std::string& mac) const {
    DeviceHandle handle = handleFor(mac);
    if (handle == INVALID_DEVICE_HANDLE) return false;
    DeviceState state;
    if (devices_->getState(handle, state) != ERR_NONE) return false;
    DynamicJsonDocument doc(2048);
    doc["handle"] = handle;
    fillStateJson(doc.createNestedObject("state"), state);
    serializeJson(doc, Serial);
    Serial.println();
    return true;
}

void SihasGateway::publishState(DeviceHandle handle, const StateChange& change) const {
    DynamicJsonDocument doc(2048);
    doc["event"] = change.availability_changed ? "availability" : "state";
    doc["handle"] = handle;
    JsonArray changed = doc.createNestedArray("changed");
    for (const auto& name : change.changed_channels) changed.add(name.c_str());
    fillStateJson(doc.createNestedObject("state"), change.state);
    serializeJson(doc, Serial);
    Serial.println();
}

void SihasGateway::printStatistics() const {
    char buf[320];
    for (DeviceHandle handle : devices_->getHandles()) {
        if (devices_->getStatistics(handle, buf, sizeof(buf)) == ERR_NONE) {
            Serial.println(buf);
        }
    }
    Serial.printf("WiFi: %s\n", wifi_->isConnected() ? wifi_->localIp().c_str() : "disconnected");
}
