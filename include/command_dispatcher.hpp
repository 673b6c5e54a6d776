#pragma once
#include <stdint.h>
#include <functional>
#include <mutex>
#include <string>
#include "errors.hpp"
#include "types.hpp"
#include "device_profiles.hpp"

class ProtocolAdapter;
class DevicePoller;

// Outcome of one write intent.
struct CommandResult {
    std::string channel;
    ChannelValue requested;
    uint16_t register_address = 0;
    uint16_t register_word = 0;       // word sent (valid when a write was attempted)
    ErrorCode error = ERR_NONE;
    RecoveryAction action = RecoveryAction::NONE;
    std::string error_details;
    uint32_t executed_at = 0;
    bool sent = false;                // false when rejected before any I/O

    bool ok() const { return error == ERR_NONE; }
};

class CommandDispatcher {
public:
    CommandDispatcher(ProtocolAdapter* adapter, const CapabilitySet* capabilities,
                      DevicePoller* poller, const std::string& label);
    ~CommandDispatcher();

    // Validates, encodes and sends exactly one register write. The cached
    // state is updated only when the device acknowledged the write.
    CommandResult write(const std::string& channel, const ChannelValue& value);

    // Callback when a command finished (either way)
    void onCommandExecuted(std::function<void(const CommandResult&)> callback);

    uint32_t getExecutedCount() const;
    uint32_t getFailedCount() const;

private:
    // Channel must exist and be writable
    bool validateCommand(const std::string& channel, const ChannelSpec*& spec, std::string& error_reason) const;
    CommandResult finish(CommandResult& result);

    ProtocolAdapter* adapter_;
    const CapabilitySet* capabilities_;
    DevicePoller* poller_;
    std::string label_;

    std::function<void(const CommandResult&)> onExecutedCallback_;
    mutable std::mutex stats_mutex_;
    uint32_t executed_count_ = 0;
    uint32_t failed_count_ = 0;
};
