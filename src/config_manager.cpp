#include "../include/config_manager.hpp"
#include "../include/device_profiles.hpp"
#include "../include/types.hpp"
#include "../include/logger.hpp"
#include <Arduino.h>
#include <ArduinoJson.h>
#include <FS.h>
#include <LittleFS.h>

static const size_t CONFIG_JSON_CAPACITY = 4096;

bool validatePollInterval(const PollingConfig& rules, uint32_t interval_ms, std::string& reason) {
    if (interval_ms < rules.min_interval_ms) {
        reason = "Poll interval too low (min: " +
                 std::to_string(rules.min_interval_ms) + " ms)";
        return false;
    }
    if (interval_ms > rules.max_interval_ms) {
        reason = "Poll interval too high (max: " +
                 std::to_string(rules.max_interval_ms) + " ms)";
        return false;
    }
    return true;
}

bool validateExchangeTimeout(uint32_t timeout_ms, std::string& reason) {
    if (timeout_ms < MIN_EXCHANGE_TIMEOUT_MS || timeout_ms > MAX_EXCHANGE_TIMEOUT_MS) {
        reason = "Exchange timeout must be " + std::to_string(MIN_EXCHANGE_TIMEOUT_MS) + ".." +
                 std::to_string(MAX_EXCHANGE_TIMEOUT_MS) + " ms";
        return false;
    }
    return true;
}

ConfigManager::ConfigManager(const char* config_file)
    : config_file_(config_file ? config_file : "/config/gateway.json") {
    initializeDefaults();
}

ConfigManager::~ConfigManager() {}

void ConfigManager::initializeDefaults() {
    logging_config_.log_level = "INFO";

    wifi_config_.ssid = "";
    wifi_config_.password = "";
    wifi_config_.reconnect_interval_ms = 10000;

    transport_config_.port = 502;
    transport_config_.timeout_ms = 500;

    polling_config_.default_interval_ms = 0;
    polling_config_.min_interval_ms = 1000;     // 1 second minimum
    polling_config_.max_interval_ms = 300000;   // 5 minutes maximum

    devices_.clear();
}

bool ConfigManager::load() {
    File file = LittleFS.open(config_file_.c_str(), "r");
    if (!file) {
        Logger::info("[ConfigMgr] %s not found, using defaults", config_file_.c_str());
        return false;
    }
    String content = file.readString();
    file.close();

    std::string error;
    if (!loadFromJson(content.c_str(), error)) {
        Logger::error("[ConfigMgr] Failed to parse %s: %s", config_file_.c_str(), error.c_str());
        return false;
    }
    Logger::info("[ConfigMgr] Loaded %s: %u devices, timeout=%lu ms", config_file_.c_str(),
                 (unsigned)devices_.size(), (unsigned long)transport_config_.timeout_ms);
    return true;
}

bool ConfigManager::loadFromJson(const char* json, std::string& error) {
    DynamicJsonDocument doc(CONFIG_JSON_CAPACITY);
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        error = err.c_str();
        return false;
    }

    JsonObject wifi = doc["wifi"];
    if (!wifi.isNull()) {
        wifi_config_.ssid = wifi["ssid"] | wifi_config_.ssid.c_str();
        wifi_config_.password = wifi["password"] | wifi_config_.password.c_str();
        wifi_config_.reconnect_interval_ms = wifi["reconnect_interval_ms"] | wifi_config_.reconnect_interval_ms;
    }

    JsonObject logging = doc["logging"];
    if (!logging.isNull()) {
        logging_config_.log_level = logging["log_level"] | logging_config_.log_level.c_str();
    }

    JsonObject transport = doc["transport"];
    if (!transport.isNull()) {
        transport_config_.port = transport["port"] | transport_config_.port;
        uint32_t timeout_ms = transport["timeout_ms"] | transport_config_.timeout_ms;
        std::string reason;
        if (validateExchangeTimeout(timeout_ms, reason)) {
            transport_config_.timeout_ms = timeout_ms;
        } else {
            Logger::warn("[ConfigMgr] Ignoring timeout_ms=%lu: %s", (unsigned long)timeout_ms, reason.c_str());
        }
    }

    JsonObject polling = doc["polling"];
    if (!polling.isNull()) {
        PollingConfig candidate = polling_config_;
        candidate.default_interval_ms = polling["default_interval_ms"] | candidate.default_interval_ms;
        candidate.min_interval_ms = polling["min_interval_ms"] | candidate.min_interval_ms;
        candidate.max_interval_ms = polling["max_interval_ms"] | candidate.max_interval_ms;
        std::string reason;
        if (candidate.min_interval_ms == 0 || candidate.min_interval_ms > candidate.max_interval_ms) {
            Logger::warn("[ConfigMgr] Ignoring polling bounds %lu..%lu ms",
                         (unsigned long)candidate.min_interval_ms, (unsigned long)candidate.max_interval_ms);
        } else if (candidate.default_interval_ms != 0 &&
                   !validatePollInterval(candidate, candidate.default_interval_ms, reason)) {
            Logger::warn("[ConfigMgr] Ignoring default poll interval: %s", reason.c_str());
            candidate.default_interval_ms = 0;
            polling_config_ = candidate;
        } else {
            polling_config_ = candidate;
        }
    }

    JsonArray devices = doc["devices"];
    if (!devices.isNull()) {
        devices_.clear();
        for (JsonObject d : devices) {
            DeviceEntry entry;
            entry.name = d["name"] | "";
            entry.ip = d["ip"] | "";
            entry.mac = d["mac"] | "";
            entry.type = d["type"] | "";
            entry.cfg = d["cfg"] | 0u;
            entry.poll_interval_s = d["poll_interval"] | 0u;
            std::string reason;
            if (!upsertDevice(entry, reason)) {
                Logger::warn("[ConfigMgr] Skipping device '%s': %s", entry.name.c_str(), reason.c_str());
            }
        }
    }
    return true;
}

std::string ConfigManager::toJson() const {
    DynamicJsonDocument doc(CONFIG_JSON_CAPACITY);
    JsonObject wifi = doc.createNestedObject("wifi");
    wifi["ssid"] = wifi_config_.ssid.c_str();
    wifi["password"] = wifi_config_.password.c_str();
    wifi["reconnect_interval_ms"] = wifi_config_.reconnect_interval_ms;

    JsonObject logging = doc.createNestedObject("logging");
    logging["log_level"] = logging_config_.log_level.c_str();

    JsonObject transport = doc.createNestedObject("transport");
    transport["port"] = transport_config_.port;
    transport["timeout_ms"] = transport_config_.timeout_ms;

    JsonObject polling = doc.createNestedObject("polling");
    polling["default_interval_ms"] = polling_config_.default_interval_ms;
    polling["min_interval_ms"] = polling_config_.min_interval_ms;
    polling["max_interval_ms"] = polling_config_.max_interval_ms;

    JsonArray devices = doc.createNestedArray("devices");
    for (const auto& entry : devices_) {
        JsonObject d = devices.createNestedObject();
        d["name"] = entry.name.c_str();
        d["ip"] = entry.ip.c_str();
        d["mac"] = entry.mac.c_str();
        d["type"] = entry.type.c_str();
        d["cfg"] = entry.cfg;
        d["poll_interval"] = entry.poll_interval_s;
    }

    std::string out;
    serializeJson(doc, out);
    return out;
}

bool ConfigManager::save() const {
    File file = LittleFS.open(config_file_.c_str(), "w");
    if (!file) {
        Logger::error("[ConfigMgr] Cannot open %s for writing", config_file_.c_str());
        return false;
    }
    std::string json = toJson();
    size_t written = file.print(json.c_str());
    file.close();
    if (written != json.size()) {
        Logger::error("[ConfigMgr] Short write to %s", config_file_.c_str());
        return false;
    }
    Logger::info("[ConfigMgr] Saved %u devices to %s", (unsigned)devices_.size(), config_file_.c_str());
    return true;
}

LoggingConfig ConfigManager::getLoggingConfig() const { return logging_config_; }
WifiConfig ConfigManager::getWifiConfig() const { return wifi_config_; }
TransportConfig ConfigManager::getTransportConfig() const { return transport_config_; }
PollingConfig ConfigManager::getPollingConfig() const { return polling_config_; }
std::vector<DeviceEntry> ConfigManager::getDevices() const { return devices_; }

bool ConfigManager::upsertDevice(const DeviceEntry& entry, std::string& reason) {
    DeviceEntry normalized = entry;
    if (!normalizeHost(entry.ip, normalized.ip)) {
        reason = "Invalid IP address: " + entry.ip;
        return false;
    }
    if (!normalizeMac(entry.mac, normalized.mac)) {
        reason = "Invalid MAC address: " + entry.mac;
        return false;
    }
    DeviceType type;
    if (!deviceTypeFromTag(entry.type, type)) {
        reason = "Unknown device type: " + entry.type;
        return false;
    }
    normalized.type = deviceTypeToTag(type);
    if (normalized.name.empty()) {
        normalized.name = normalized.type + "-" + compactMac(normalized.mac);
    }

    for (auto& existing : devices_) {
        if (existing.mac == normalized.mac) {
            existing = normalized;
            return true;
        }
    }
    devices_.push_back(normalized);
    return true;
}

bool ConfigManager::removeDevice(const std::string& mac) {
    std::string normalized;
    if (!normalizeMac(mac, normalized)) return false;
    for (auto it = devices_.begin(); it != devices_.end(); ++it) {
        if (it->mac == normalized) {
            devices_.erase(it);
            return true;
        }
    }
    return false;
}
