#pragma once
#include <stdint.h>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config_manager.hpp"
#include "sihas_device.hpp"

// Builds the transport for a new device; the default opens a UdpTransport.
typedef std::function<Transport*(const DeviceAddress& address)> TransportFactory;

struct SetupResult {
    DeviceHandle handle = INVALID_DEVICE_HANDLE;
    ErrorCode error = ERR_NONE;
    RecoveryAction action = RecoveryAction::NONE;
    std::string reason;

    bool ok() const { return error == ERR_NONE; }
};

// Entry point for the platform side: every call is keyed by the handle
// returned from createDevice(). Devices never share locks with each other.
class DeviceManager {
public:
    DeviceManager(const TransportConfig& transport, const PollingConfig& polling,
                  TransportFactory factory = TransportFactory());
    ~DeviceManager();

    // Validates everything up front; nothing is sent to the device here.
    // poll_interval_s == 0 selects the configured or profile default.
    SetupResult createDevice(const DeviceAddress& address, uint32_t config_code, uint32_t poll_interval_s);

    ErrorCode getState(DeviceHandle handle, DeviceState& out) const;
    CommandResult write(DeviceHandle handle, const std::string& channel, const ChannelValue& value);
    ErrorCode subscribe(DeviceHandle handle, StateListener listener);
    ErrorCode destroy(DeviceHandle handle);

    ErrorCode refresh(DeviceHandle handle, PollResult* result = nullptr);
    ErrorCode updateHost(DeviceHandle handle, const std::string& host);
    ErrorCode getCapabilities(DeviceHandle handle, CapabilitySet& out) const;
    ErrorCode getAddress(DeviceHandle handle, DeviceAddress& out) const;
    ErrorCode getStatistics(DeviceHandle handle, char* outBuf, size_t outBufSize) const;
    DeviceHandle findByMac(const std::string& mac) const;
    std::vector<DeviceHandle> getHandles() const;
    size_t getDeviceCount() const;

    // Drives every device's poll schedule; call from the main loop.
    void loop();
    void destroyAll();

private:
    std::shared_ptr<SihasDevice> find(DeviceHandle handle) const;
    SetupResult reject(ErrorCode code, const std::string& reason) const;
    bool resolveInterval(uint32_t poll_interval_s, const CapabilitySet& caps,
                         uint32_t& interval_ms, std::string& reason) const;

    TransportConfig transport_config_;
    PollingConfig polling_config_;
    TransportFactory factory_;

    mutable std::mutex devices_mutex_;
    std::map<DeviceHandle, std::shared_ptr<SihasDevice>> devices_;
    DeviceHandle next_handle_ = 1;
};
