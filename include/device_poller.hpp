#pragma once
#include <stdint.h>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "poll_ticker.hpp"
#include "types.hpp"
#include "device_profiles.hpp"
#include "register_codec.hpp"

class ProtocolAdapter;

typedef std::function<void(const StateChange&)> StateListener;
typedef std::function<void(const PollResult&)> PollResultListener;

// Keeps one device's cached state fresh on a fixed cadence and owns that
// state (the command dispatcher updates it through applyWrite()).
//
//   Idle -> Polling -> Updated | Failed -> Idle
//
// A tick that arrives while a cycle is still running is skipped. Failures
// never stop the schedule and never change the interval.
class DevicePoller {
public:
    DevicePoller(ProtocolAdapter* adapter, const CapabilitySet* capabilities, const std::string& label);
    ~DevicePoller();

    void begin(uint32_t interval_ms);
    // Stops the schedule; a cycle already running finishes without touching
    // state or listeners. Later refresh() calls do nothing until begin().
    void end();
    void loop();

    // Runs a cycle when the tick is due and no cycle is in progress.
    // Returns true if a cycle ran.
    bool tick(uint32_t now_ms);

    // One cycle now, same skip rule as a scheduled tick.
    bool refresh(PollResult* result = nullptr);

    DeviceState snapshot() const;
    bool cachedWord(RegisterAddress address, uint16_t& out) const;

    // Optimistic update after an acknowledged write. Every channel reading
    // the written register is re-decoded.
    void applyWrite(const ChannelSpec& channel, uint16_t word, const ChannelValue& value);

    void subscribe(StateListener listener);
    void onPollResult(PollResultListener listener);

    bool isBusy() const { return busy_.load(); }
    bool isRunning() const { return ticker_.running(); }
    uint32_t getInterval() const { return ticker_.interval(); }
    uint32_t getConsecutiveFailures() const;
    uint32_t getSkippedTicks() const { return skipped_ticks_.load(); }
    void getStatistics(char* outBuf, size_t outBufSize) const;

    static const uint32_t FAILURE_THRESHOLD = 3;

private:
    PollResult runCycle();
    bool tryRunCycle(PollResult* result);
    void notify(const StateChange& change);

    ProtocolAdapter* adapter_;
    const CapabilitySet* capabilities_;
    std::string label_;
    PollTicker ticker_;

    std::atomic<bool> busy_;
    std::atomic<bool> stopped_;
    std::atomic<uint32_t> skipped_ticks_;

    mutable std::mutex state_mutex_;
    DeviceState state_;
    RegisterBank registers_;
    // Generation of the last acknowledged write per register.
    std::vector<uint32_t> written_generation_;
    uint32_t write_generation_ = 0;
    uint32_t consecutive_failures_ = 0;
    uint32_t cycles_ = 0;

    std::mutex listeners_mutex_;
    std::vector<StateListener> listeners_;
    PollResultListener poll_result_listener_;
};
