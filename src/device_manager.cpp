#include "../include/device_manager.hpp"
#include "../include/udp_transport.hpp"
#include "../include/logger.hpp"

DeviceManager::DeviceManager(const TransportConfig& transport, const PollingConfig& polling,
                             TransportFactory factory)
    : transport_config_(transport), polling_config_(polling), factory_(factory) {
    if (!factory_) {
        uint16_t port = transport_config_.port;
        factory_ = [port](const DeviceAddress& address) -> Transport* {
            return new UdpTransport(address.host, port);
        };
    }
}

DeviceManager::~DeviceManager() {
    destroyAll();
}

SetupResult DeviceManager::reject(ErrorCode code, const std::string& reason) const {
    SetupResult result;
    result.error = code;
    result.action = ErrorClassifier::recoveryFor(code);
    result.reason = reason;
    Logger::error("[DeviceMgr] Setup rejected: %s (%s)", reason.c_str(), errorCodeToString(code));
    return result;
}

bool DeviceManager::resolveInterval(uint32_t poll_interval_s, const CapabilitySet& caps,
                                    uint32_t& interval_ms, std::string& reason) const {
    if (poll_interval_s == 0) {
        interval_ms = polling_config_.default_interval_ms != 0 ? polling_config_.default_interval_ms
                                                               : caps.default_poll_interval_ms;
        return true;
    }
    uint64_t requested = (uint64_t)poll_interval_s * 1000;
    if (requested > polling_config_.max_interval_ms) {
        reason = "Poll interval too high (max: " + std::to_string(polling_config_.max_interval_ms) + " ms)";
        return false;
    }
    interval_ms = (uint32_t)requested;
    return validatePollInterval(polling_config_, interval_ms, reason);
}

SetupResult DeviceManager::createDevice(const DeviceAddress& address, uint32_t config_code,
                                        uint32_t poll_interval_s) {
    DeviceAddress normalized;
    if (!normalizeHost(address.host, normalized.host)) {
        return reject(ERR_CONFIG, "invalid host '" + address.host + "'");
    }
    if (!normalizeMac(address.mac, normalized.mac)) {
        return reject(ERR_CONFIG, "invalid MAC '" + address.mac + "'");
    }
    DeviceType type;
    if (!deviceTypeFromTag(address.type_tag, type)) {
        return reject(ERR_UNKNOWN_PROFILE, "unknown device type '" + address.type_tag + "'");
    }
    normalized.type_tag = deviceTypeToTag(type);

    CapabilitySet caps;
    if (resolveProfile(type, config_code, caps) != ERR_NONE) {
        return reject(ERR_UNKNOWN_PROFILE, "no layout for " + normalized.type_tag +
                      " with config code " + std::to_string(config_code));
    }

    uint32_t interval_ms = 0;
    std::string reason;
    if (!resolveInterval(poll_interval_s, caps, interval_ms, reason)) {
        return reject(ERR_CONFIG, reason);
    }

    Transport* transport = factory_(normalized);
    if (!transport) {
        return reject(ERR_CONFIG, "no transport for " + normalized.host);
    }

    std::shared_ptr<SihasDevice> device(
        new SihasDevice(normalized, caps, transport, transport_config_.timeout_ms));

    SetupResult result;
    bool duplicate = false;
    {
        std::lock_guard<std::mutex> lock(devices_mutex_);
        for (const auto& kv : devices_) {
            if (kv.second->getAddress().mac == normalized.mac) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            result.handle = next_handle_++;
            devices_[result.handle] = device;
        }
    }
    if (duplicate) {
        return reject(ERR_CONFIG, "device " + normalized.mac + " already registered");
    }
    device->begin(interval_ms);
    Logger::info("[DeviceMgr] Created %s (handle %lu)", device->getLabel().c_str(), (unsigned long)result.handle);
    return result;
}

std::shared_ptr<SihasDevice> DeviceManager::find(DeviceHandle handle) const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    auto it = devices_.find(handle);
    if (it == devices_.end()) return std::shared_ptr<SihasDevice>();
    return it->second;
}

ErrorCode DeviceManager::getState(DeviceHandle handle, DeviceState& out) const {
    std::shared_ptr<SihasDevice> device = find(handle);
    if (!device) return ERR_UNKNOWN_DEVICE;
    out = device->getState();
    return ERR_NONE;
}

CommandResult DeviceManager::write(DeviceHandle handle, const std::string& channel, const ChannelValue& value) {
    std::shared_ptr<SihasDevice> device = find(handle);
    if (!device) {
        CommandResult result;
        result.channel = channel;
        result.requested = value;
        result.error = ERR_UNKNOWN_DEVICE;
        result.action = ErrorClassifier::recoveryFor(ERR_UNKNOWN_DEVICE);
        result.error_details = "no device with handle " + std::to_string(handle);
        return result;
    }
    return device->write(channel, value);
}

ErrorCode DeviceManager::subscribe(DeviceHandle handle, StateListener listener) {
    std::shared_ptr<SihasDevice> device = find(handle);
    if (!device) return ERR_UNKNOWN_DEVICE;
    device->subscribe(listener);
    return ERR_NONE;
}

ErrorCode DeviceManager::destroy(DeviceHandle handle) {
    std::shared_ptr<SihasDevice> device;
    {
        std::lock_guard<std::mutex> lock(devices_mutex_);
        auto it = devices_.find(handle);
        if (it == devices_.end()) return ERR_UNKNOWN_DEVICE;
        device = it->second;
        devices_.erase(it);
    }
    device->shutdown();
    Logger::info("[DeviceMgr] Destroyed %s (handle %lu)", device->getLabel().c_str(), (unsigned long)handle);
    return ERR_NONE;
}

ErrorCode DeviceManager::refresh(DeviceHandle handle, PollResult* result) {
    std::shared_ptr<SihasDevice> device = find(handle);
    if (!device) return ERR_UNKNOWN_DEVICE;
    PollResult outcome;
    if (!device->refresh(&outcome)) {
        // Busy with a scheduled cycle; that cycle's result will be published.
        return ERR_NONE;
    }
    if (result) *result = outcome;
    return outcome.error;
}

ErrorCode DeviceManager::updateHost(DeviceHandle handle, const std::string& host) {
    std::shared_ptr<SihasDevice> device = find(handle);
    if (!device) return ERR_UNKNOWN_DEVICE;
    std::string normalized;
    if (!normalizeHost(host, normalized)) return ERR_CONFIG;
    if (!device->updateHost(normalized)) return ERR_CONFIG;
    return ERR_NONE;
}

ErrorCode DeviceManager::getCapabilities(DeviceHandle handle, CapabilitySet& out) const {
    std::shared_ptr<SihasDevice> device = find(handle);
    if (!device) return ERR_UNKNOWN_DEVICE;
    out = device->getCapabilities();
    return ERR_NONE;
}

ErrorCode DeviceManager::getAddress(DeviceHandle handle, DeviceAddress& out) const {
    std::shared_ptr<SihasDevice> device = find(handle);
    if (!device) return ERR_UNKNOWN_DEVICE;
    out = device->getAddress();
    return ERR_NONE;
}

ErrorCode DeviceManager::getStatistics(DeviceHandle handle, char* outBuf, size_t outBufSize) const {
    std::shared_ptr<SihasDevice> device = find(handle);
    if (!device) return ERR_UNKNOWN_DEVICE;
    device->getStatistics(outBuf, outBufSize);
    return ERR_NONE;
}

DeviceHandle DeviceManager::findByMac(const std::string& mac) const {
    std::string normalized;
    if (!normalizeMac(mac, normalized)) return INVALID_DEVICE_HANDLE;
    std::lock_guard<std::mutex> lock(devices_mutex_);
    for (const auto& kv : devices_) {
        if (kv.second->getAddress().mac == normalized) return kv.first;
    }
    return INVALID_DEVICE_HANDLE;
}

std::vector<DeviceHandle> DeviceManager::getHandles() const {
    std::vector<DeviceHandle> handles;
    std::lock_guard<std::mutex> lock(devices_mutex_);
    for (const auto& kv : devices_) handles.push_back(kv.first);
    return handles;
}

size_t DeviceManager::getDeviceCount() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    return devices_.size();
}

void DeviceManager::loop() {
    std::vector<std::shared_ptr<SihasDevice>> devices;
    {
        std::lock_guard<std::mutex> lock(devices_mutex_);
        for (const auto& kv : devices_) devices.push_back(kv.second);
    }
    for (const auto& device : devices) {
        device->loop();
    }
}

void DeviceManager::destroyAll() {
    std::map<DeviceHandle, std::shared_ptr<SihasDevice>> devices;
    {
        std::lock_guard<std::mutex> lock(devices_mutex_);
        devices.swap(devices_);
    }
    for (const auto& kv : devices) {
        kv.second->shutdown();
    }
}
