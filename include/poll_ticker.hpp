#pragma once

// millis()-based periodic timer driven from loop().
// Missed periods collapse into one firing: a tick that is late by several
// intervals fires once and re-arms from the current time.

#include <stdint.h>

class PollTicker {
public:
    explicit PollTicker(uint32_t interval = 0)
        : interval_(interval), running_(false), last_ms_(0) {}

    void interval(uint32_t ms) { interval_ = ms; }
    uint32_t interval() const { return interval_; }

    // fire_now: the first update() after start() fires immediately.
    void start(uint32_t now_ms, bool fire_now = false) {
        running_ = true;
        last_ms_ = fire_now ? now_ms - interval_ : now_ms;
    }
    void stop() { running_ = false; }
    bool running() const { return running_; }

    // True when a period has elapsed; the caller runs the task.
    bool update(uint32_t now_ms) {
        if (!running_ || interval_ == 0) return false;
        if ((uint32_t)(now_ms - last_ms_) >= interval_) {
            last_ms_ = now_ms;
            return true;
        }
        return false;
    }

private:
    uint32_t interval_;
    bool running_;
    uint32_t last_ms_;
};
