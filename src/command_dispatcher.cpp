#include "../include/command_dispatcher.hpp"
#include "../include/device_poller.hpp"
#include "../include/protocol_adapter.hpp"
#include "../include/error_classifier.hpp"
#include "../include/register_codec.hpp"
#include "../include/logger.hpp"
#include <Arduino.h>

CommandDispatcher::CommandDispatcher(ProtocolAdapter* adapter, const CapabilitySet* capabilities,
                                     DevicePoller* poller, const std::string& label)
    : adapter_(adapter), capabilities_(capabilities), poller_(poller), label_(label) {
}

CommandDispatcher::~CommandDispatcher() {
}

void CommandDispatcher::onCommandExecuted(std::function<void(const CommandResult&)> callback) {
    onExecutedCallback_ = callback;
}

bool CommandDispatcher::validateCommand(const std::string& channel, const ChannelSpec*& spec,
                                        std::string& error_reason) const {
    if (channel.empty()) {
        error_reason = "Channel name cannot be empty";
        return false;
    }
    spec = capabilities_->findChannel(channel);
    if (!spec) {
        error_reason = "Unknown channel: " + channel;
        return false;
    }
    if (!spec->writable()) {
        error_reason = "Channel is read-only: " + channel;
        return false;
    }
    return true;
}

CommandResult CommandDispatcher::write(const std::string& channel, const ChannelValue& value) {
    CommandResult result;
    result.channel = channel;
    result.requested = value;
    result.executed_at = millis();

    const ChannelSpec* spec = nullptr;
    std::string error_reason;
    if (!validateCommand(channel, spec, error_reason)) {
        result.error = ERR_NOT_WRITABLE;
        result.error_details = error_reason;
        Logger::error("[Dispatch] %s: command validation failed: %s", label_.c_str(), error_reason.c_str());
        return finish(result);
    }

    uint16_t current_word = 0;
    poller_->cachedWord(spec->address, current_word);
    uint16_t word = 0;
    ErrorCode err = encodeChannel(*spec, value, current_word, word, error_reason);
    if (err != ERR_NONE) {
        result.error = err;
        result.error_details = error_reason;
        Logger::error("[Dispatch] %s: cannot encode %s: %s", label_.c_str(), channel.c_str(), error_reason.c_str());
        return finish(result);
    }

    result.register_address = spec->address;
    result.register_word = word;
    result.sent = true;
    Logger::debug("[Dispatch] %s: writing %s -> register %u = %u", label_.c_str(), channel.c_str(),
                  (unsigned)spec->address, (unsigned)word);

    err = adapter_->writeRegister(spec->address, word);
    if (err != ERR_NONE) {
        result.error = err;
        result.error_details = adapter_->getLastErrorDetails();
        Logger::error("[Dispatch] %s: write of %s failed: %s", label_.c_str(), channel.c_str(),
                      errorCodeToString(err));
        return finish(result);
    }

    poller_->applyWrite(*spec, word, value);
    Logger::info("[Dispatch] %s: %s written (register %u = %u)", label_.c_str(), channel.c_str(),
                 (unsigned)spec->address, (unsigned)word);
    return finish(result);
}

CommandResult CommandDispatcher::finish(CommandResult& result) {
    result.action = ErrorClassifier::recoveryFor(result.error);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        executed_count_++;
        if (!result.ok()) failed_count_++;
    }
    if (onExecutedCallback_) {
        onExecutedCallback_(result);
    }
    return result;
}

uint32_t CommandDispatcher::getExecutedCount() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return executed_count_;
}

uint32_t CommandDispatcher::getFailedCount() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return failed_count_;
}
