#include <Arduino.h>
#include "../include/device_poller.hpp"
#include "../include/protocol_adapter.hpp"
#include "../include/logger.hpp"

const uint32_t DevicePoller::FAILURE_THRESHOLD;

DevicePoller::DevicePoller(ProtocolAdapter* adapter, const CapabilitySet* capabilities, const std::string& label)
    : adapter_(adapter), capabilities_(capabilities), label_(label), busy_(false), stopped_(false),
      skipped_ticks_(0) {
    size_t bank_size = capabilities_->registerSpan();
    for (const auto& block : capabilities_->read_blocks) {
        size_t end = (size_t)block.start + block.count;
        if (end > bank_size) bank_size = end;
    }
    registers_.assign(bank_size, 0);
    written_generation_.assign(bank_size, 0);
    // Every channel is present from the start, invalid until the first poll.
    for (const auto& channel : capabilities_->channels) {
        state_.values[channel.name] = ChannelValue::invalid();
    }
}

DevicePoller::~DevicePoller() { end(); }

void DevicePoller::begin(uint32_t interval_ms) {
    stopped_.store(false);
    ticker_.interval(interval_ms);
    ticker_.start(millis(), true);
    Logger::info("[Poller] %s: polling every %lu ms", label_.c_str(), (unsigned long)interval_ms);
}

void DevicePoller::end() {
    stopped_.store(true);
    ticker_.stop();
}

void DevicePoller::loop() {
    tick(millis());
}

bool DevicePoller::tick(uint32_t now_ms) {
    if (stopped_.load() || !ticker_.update(now_ms)) return false;
    return tryRunCycle(nullptr);
}

bool DevicePoller::refresh(PollResult* result) {
    return tryRunCycle(result);
}

bool DevicePoller::tryRunCycle(PollResult* result) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        skipped_ticks_++;
        Logger::debug("[Poller] %s: previous cycle still running, tick skipped", label_.c_str());
        return false;
    }
    // Shutdown calls end() and then waits on busy_: a cycle either sees
    // stopped_ here or is waited for.
    if (stopped_.load()) {
        busy_.store(false);
        return false;
    }
    PollResult outcome = runCycle();
    busy_.store(false);
    if (result) *result = outcome;
    return true;
}

PollResult DevicePoller::runCycle() {
    RegisterBank bank;
    uint32_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        bank = registers_;
        generation = write_generation_;
    }

    ErrorCode error = ERR_NONE;
    for (const auto& block : capabilities_->read_blocks) {
        error = adapter_->readRegisters(block.start, block.count, &bank[block.start]);
        if (error != ERR_NONE) break;
    }

    PollResult result;
    result.error = error;
    if (stopped_.load()) {
        // Shut down while reading: leave state and listeners alone.
        result.state = snapshot();
        return result;
    }
    StateChange change;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        cycles_++;
        if (error != ERR_NONE) {
            consecutive_failures_++;
            if (consecutive_failures_ == 1) {
                Logger::warn("[Poller] %s: poll failed: %s (%s)", label_.c_str(),
                             errorCodeToString(error), adapter_->getLastErrorDetails().c_str());
            } else {
                Logger::debug("[Poller] %s: poll failed: %s (%lu in a row)", label_.c_str(),
                              errorCodeToString(error), (unsigned long)consecutive_failures_);
            }
            if (state_.available && consecutive_failures_ >= FAILURE_THRESHOLD) {
                state_.available = false;
                result.availability_changed = true;
                Logger::warn("[Poller] %s: unavailable after %lu failed polls", label_.c_str(),
                             (unsigned long)consecutive_failures_);
            }
        } else {
            if (consecutive_failures_ > 0) {
                Logger::info("[Poller] %s: responding again after %lu failed polls", label_.c_str(),
                             (unsigned long)consecutive_failures_);
            }
            consecutive_failures_ = 0;
            // A write acknowledged while this cycle was reading is newer
            // than what the read returned.
            for (size_t i = 0; i < bank.size(); ++i) {
                if (written_generation_[i] > generation) bank[i] = registers_[i];
            }
            registers_.swap(bank);

            std::map<std::string, ChannelValue> decoded;
            decodeChannels(capabilities_->channels, registers_, decoded);
            for (const auto& kv : decoded) {
                auto it = state_.values.find(kv.first);
                if (it == state_.values.end() || it->second != kv.second) {
                    change.changed_channels.push_back(kv.first);
                }
            }
            state_.values.swap(decoded);
            state_.last_updated_ms = millis();
            result.values_changed = !change.changed_channels.empty();

            if (!state_.available) {
                state_.available = true;
                result.availability_changed = true;
                Logger::info("[Poller] %s: available", label_.c_str());
            }
        }
        result.state = state_;
    }

    if (result.availability_changed || result.values_changed) {
        change.state = result.state;
        change.availability_changed = result.availability_changed;
        notify(change);
    }
    PollResultListener poll_listener;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        poll_listener = poll_result_listener_;
    }
    if (poll_listener) poll_listener(result);
    return result;
}

DeviceState DevicePoller::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool DevicePoller::cachedWord(RegisterAddress address, uint16_t& out) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (address >= registers_.size()) return false;
    out = registers_[address];
    return true;
}

void DevicePoller::applyWrite(const ChannelSpec& channel, uint16_t word, const ChannelValue& value) {
    if (stopped_.load()) return;
    StateChange change;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (channel.address >= registers_.size()) {
            ChannelValue& slot = state_.values[channel.name];
            if (slot == value) return;
            slot = value;
            change.changed_channels.push_back(channel.name);
        } else {
            registers_[channel.address] = word;
            written_generation_[channel.address] = ++write_generation_;
            // Every channel sharing the register follows the new word, in
            // canonical form (label + index, rounded mired, ...).
            for (const auto& spec : capabilities_->channels) {
                if (!channelUsesRegister(spec, channel.address)) continue;
                ChannelValue decoded = decodeChannel(spec, registers_);
                ChannelValue& slot = state_.values[spec.name];
                if (slot == decoded) continue;
                slot = decoded;
                change.changed_channels.push_back(spec.name);
            }
        }
        if (change.changed_channels.empty()) return;
        state_.last_updated_ms = millis();
        change.state = state_;
    }
    notify(change);
}

void DevicePoller::subscribe(StateListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(listener);
}

void DevicePoller::onPollResult(PollResultListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    poll_result_listener_ = listener;
}

void DevicePoller::notify(const StateChange& change) {
    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        if (listener) listener(change);
    }
}

uint32_t DevicePoller::getConsecutiveFailures() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return consecutive_failures_;
}

void DevicePoller::getStatistics(char* outBuf, size_t outBufSize) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    snprintf(outBuf, outBufSize, "interval=%lu, cycles=%lu, failures=%lu, skipped=%lu, available=%d",
             (unsigned long)ticker_.interval(), (unsigned long)cycles_,
             (unsigned long)consecutive_failures_, (unsigned long)skipped_ticks_.load(),
             state_.available ? 1 : 0);
}
