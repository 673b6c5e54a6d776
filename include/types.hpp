#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "errors.hpp"

using DeviceHandle = uint32_t;
using RegisterAddress = uint16_t;
using RegisterWord = uint16_t;

static const DeviceHandle INVALID_DEVICE_HANDLE = 0;

// Where a device lives and what it is. The MAC is the identity key; the
// host may be corrected later by discovery.
struct DeviceAddress {
    std::string host;
    std::string mac;
    std::string type_tag;
};

// Normalised forms used everywhere inside the gateway.
// "192.168.001.010" -> "192.168.1.10"; returns false when not a dotted quad.
bool normalizeHost(const std::string& in, std::string& out);
// "aabbccddeeff" / "aa-bb-cc-dd-ee-ff" -> "AA:BB:CC:DD:EE:FF"
bool normalizeMac(const std::string& in, std::string& out);
// "AA:BB:CC:DD:EE:FF" -> "AABBCCDDEEFF"
std::string compactMac(const std::string& mac);

// Decoded value of one channel. Numeric channels carry `number`; enum
// channels carry both the raw index in `number` and the `label`.
struct ChannelValue {
    bool valid = false;
    float number = 0.0f;
    std::string label;

    static ChannelValue invalid() { return ChannelValue(); }
    static ChannelValue fromNumber(float v) { ChannelValue c; c.valid = true; c.number = v; return c; }
    static ChannelValue fromBool(bool on) { return fromNumber(on ? 1.0f : 0.0f); }
    static ChannelValue fromLabel(const std::string& l, float index = 0.0f) {
        ChannelValue c; c.valid = true; c.number = index; c.label = l; return c;
    }

    bool operator==(const ChannelValue& o) const {
        return valid == o.valid && number == o.number && label == o.label;
    }
    bool operator!=(const ChannelValue& o) const { return !(*this == o); }
};

struct DeviceState {
    std::map<std::string, ChannelValue> values;
    uint32_t last_updated_ms = 0;
    bool available = false;
};

// Outcome of exactly one poll cycle.
struct PollResult {
    ErrorCode error = ERR_NONE;
    DeviceState state;
    bool availability_changed = false;
    bool values_changed = false;

    bool ok() const { return error == ERR_NONE; }
};

// Delivered to subscribers when availability flips or values change.
struct StateChange {
    DeviceState state;
    bool availability_changed = false;
    std::vector<std::string> changed_channels;
};
