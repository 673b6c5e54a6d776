#pragma once
#include <stdint.h>
#include <atomic>
#include <mutex>
#include <string>

#include "types.hpp"
#include "device_profiles.hpp"
#include "transport.hpp"
#include "error_classifier.hpp"
#include "protocol_adapter.hpp"
#include "device_poller.hpp"
#include "command_dispatcher.hpp"

// One SiHAS device: its transport, register access, poll schedule and
// command path, wired together and torn down as a unit.
class SihasDevice {
public:
    // Takes ownership of `transport`.
    SihasDevice(const DeviceAddress& address, const CapabilitySet& capabilities,
                Transport* transport, uint32_t timeout_ms);
    ~SihasDevice();

    void begin(uint32_t poll_interval_ms);
    void loop();

    // Stops the schedule, cancels and waits out any exchange in flight.
    // Nothing touches the network after this returns.
    void shutdown();

    DeviceState getState() const;
    CommandResult write(const std::string& channel, const ChannelValue& value);
    void subscribe(StateListener listener);
    bool refresh(PollResult* result = nullptr);
    bool updateHost(const std::string& host);

    DeviceAddress getAddress() const;
    const CapabilitySet& getCapabilities() const { return capabilities_; }
    const std::string& getLabel() const { return label_; }
    uint32_t getPollInterval() const;
    uint32_t getFaultCount(ErrorCode code) const;
    void getStatistics(char* outBuf, size_t outBufSize) const;

private:
    DeviceAddress address_;
    mutable std::mutex address_mutex_;
    const CapabilitySet capabilities_;
    std::string label_;
    std::atomic<bool> shut_down_;

    Transport* transport_ = nullptr;
    ErrorClassifier* classifier_ = nullptr;
    ProtocolAdapter* adapter_ = nullptr;
    DevicePoller* poller_ = nullptr;
    CommandDispatcher* dispatcher_ = nullptr;
};
