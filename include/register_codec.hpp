#pragma once
#include <stdint.h>
#include <map>
#include <string>
#include <vector>
#include "types.hpp"

enum class ChannelType {
    UNSIGNED,           // raw word x scale
    SIGNED,             // two's complement word x scale
    BOOLEAN,            // non-zero is on
    ENUMERATION,        // raw word indexes `labels`
    BITFIELD,           // (word & mask) >> shift, written read-modify-write
    UNSIGNED_PAIR,      // low word at address, high word at address + 1
    COLOR_TEMPERATURE,  // device 0 (warm) .. 100 (cool) <-> 500 .. 154 mired
    ACCUMULATOR         // word x multiplier + fine word (energy counters)
};

enum class ChannelAccess { READ_ONLY, READ_WRITE };

struct ChannelSpec {
    std::string name;
    RegisterAddress address = 0;
    ChannelType type = ChannelType::UNSIGNED;
    float scale = 1.0f;
    int64_t raw_min = 0;
    int64_t raw_max = 0xFFFF;
    uint16_t mask = 0xFFFF;
    uint8_t shift = 0;
    uint16_t on_value = 1;
    std::vector<std::string> labels;
    std::string unit;
    ChannelAccess access = ChannelAccess::READ_ONLY;

    // ACCUMULATOR only. The multiplier switches to range_multiplier while
    // the range register is non-zero. -1: register not used.
    int32_t fine_address = -1;
    int32_t range_address = -1;
    uint16_t multiplier = 1;
    uint16_t range_multiplier = 1;

    bool writable() const { return access == ChannelAccess::READ_WRITE; }
};

// Every register the channel's value is computed from.
std::vector<RegisterAddress> channelRegisters(const ChannelSpec& spec);
bool channelUsesRegister(const ChannelSpec& spec, RegisterAddress address);

// Register words indexed by absolute register address.
using RegisterBank = std::vector<uint16_t>;

static const float MIRED_WARMEST = 500.0f;
static const float MIRED_COOLEST = 154.0f;
static const uint16_t DEVICE_COLOR_TEMP_MAX = 100;

float colorTempDeviceToMired(int32_t device_value);
uint16_t colorTempMiredToDevice(float mired);

// Out-of-range or missing words decode to ChannelValue::invalid().
ChannelValue decodeChannel(const ChannelSpec& spec, const RegisterBank& bank);
void decodeChannels(const std::vector<ChannelSpec>& specs, const RegisterBank& bank,
                    std::map<std::string, ChannelValue>& out);

// Produces the single word to write. `current_word` is the cached value of
// the target register, used by BITFIELD channels.
// Returns ERR_NOT_WRITABLE for read-only channels, ERR_VALIDATION for values
// that do not fit the channel.
ErrorCode encodeChannel(const ChannelSpec& spec, const ChannelValue& value,
                        uint16_t current_word, uint16_t& out_word, std::string& reason);
