#include "../include/register_codec.hpp"
#include <cmath>

static const float COLOR_TEMP_SPAN = MIRED_WARMEST - MIRED_COOLEST;

static bool inRange(const ChannelSpec& spec, int64_t raw) {
    return raw >= spec.raw_min && raw <= spec.raw_max;
}

static bool readWord(const RegisterBank& bank, RegisterAddress address, uint16_t& out) {
    if (address >= bank.size()) return false;
    out = bank[address];
    return true;
}

std::vector<RegisterAddress> channelRegisters(const ChannelSpec& spec) {
    std::vector<RegisterAddress> out;
    out.push_back(spec.address);
    if (spec.type == ChannelType::UNSIGNED_PAIR) {
        out.push_back((RegisterAddress)(spec.address + 1));
    } else if (spec.type == ChannelType::ACCUMULATOR) {
        if (spec.fine_address >= 0) out.push_back((RegisterAddress)spec.fine_address);
        if (spec.range_address >= 0) out.push_back((RegisterAddress)spec.range_address);
    }
    return out;
}

bool channelUsesRegister(const ChannelSpec& spec, RegisterAddress address) {
    for (RegisterAddress a : channelRegisters(spec)) {
        if (a == address) return true;
    }
    return false;
}

float colorTempDeviceToMired(int32_t device_value) {
    if (device_value < 0) device_value = 0;
    if (device_value > DEVICE_COLOR_TEMP_MAX) device_value = DEVICE_COLOR_TEMP_MAX;
    float mired = MIRED_WARMEST - (float)device_value * COLOR_TEMP_SPAN / DEVICE_COLOR_TEMP_MAX;
    return (float)lroundf(mired);
}

uint16_t colorTempMiredToDevice(float mired) {
    if (mired < MIRED_COOLEST) mired = MIRED_COOLEST;
    if (mired > MIRED_WARMEST) mired = MIRED_WARMEST;
    long device = lroundf((MIRED_WARMEST - mired) * DEVICE_COLOR_TEMP_MAX / COLOR_TEMP_SPAN);
    if (device < 0) device = 0;
    if (device > DEVICE_COLOR_TEMP_MAX) device = DEVICE_COLOR_TEMP_MAX;
    return (uint16_t)device;
}

ChannelValue decodeChannel(const ChannelSpec& spec, const RegisterBank& bank) {
    uint16_t word = 0;
    if (!readWord(bank, spec.address, word)) return ChannelValue::invalid();

    switch (spec.type) {
        case ChannelType::UNSIGNED: {
            if (!inRange(spec, word)) return ChannelValue::invalid();
            return ChannelValue::fromNumber((float)word * spec.scale);
        }
        case ChannelType::SIGNED: {
            int16_t raw = (int16_t)word;
            if (!inRange(spec, raw)) return ChannelValue::invalid();
            return ChannelValue::fromNumber((float)raw * spec.scale);
        }
        case ChannelType::BOOLEAN:
            return ChannelValue::fromBool(word != 0);
        case ChannelType::ENUMERATION: {
            if (word >= spec.labels.size()) return ChannelValue::invalid();
            return ChannelValue::fromLabel(spec.labels[word], (float)word);
        }
        case ChannelType::BITFIELD: {
            uint16_t raw = (uint16_t)((word & spec.mask) >> spec.shift);
            if (!inRange(spec, raw)) return ChannelValue::invalid();
            return ChannelValue::fromNumber((float)raw * spec.scale);
        }
        case ChannelType::UNSIGNED_PAIR: {
            uint16_t high = 0;
            if (!readWord(bank, (RegisterAddress)(spec.address + 1), high)) return ChannelValue::invalid();
            uint32_t raw = (uint32_t)word | ((uint32_t)high << 16);
            if (!inRange(spec, raw)) return ChannelValue::invalid();
            return ChannelValue::fromNumber((float)((double)raw * spec.scale));
        }
        case ChannelType::COLOR_TEMPERATURE:
            return ChannelValue::fromNumber(colorTempDeviceToMired(word));
        case ChannelType::ACCUMULATOR: {
            uint32_t factor = spec.multiplier;
            if (spec.range_address >= 0) {
                uint16_t range = 0;
                if (!readWord(bank, (RegisterAddress)spec.range_address, range)) return ChannelValue::invalid();
                if (range != 0) factor = spec.range_multiplier;
            }
            uint32_t raw = (uint32_t)word * factor;
            if (spec.fine_address >= 0) {
                uint16_t fine = 0;
                if (!readWord(bank, (RegisterAddress)spec.fine_address, fine)) return ChannelValue::invalid();
                raw += fine;
            }
            return ChannelValue::fromNumber((float)((double)raw * spec.scale));
        }
    }
    return ChannelValue::invalid();
}

void decodeChannels(const std::vector<ChannelSpec>& specs, const RegisterBank& bank,
                    std::map<std::string, ChannelValue>& out) {
    for (const auto& spec : specs) {
        out[spec.name] = decodeChannel(spec, bank);
    }
}

static ErrorCode encodeScaled(const ChannelSpec& spec, float number, int64_t& raw, std::string& reason) {
    if (spec.scale == 0.0f) {
        reason = "channel " + spec.name + " has no scale";
        return ERR_VALIDATION;
    }
    raw = llroundf(number / spec.scale);
    if (!inRange(spec, raw)) {
        reason = "value for " + spec.name + " out of range [" +
                 std::to_string((double)spec.raw_min * spec.scale) + ", " +
                 std::to_string((double)spec.raw_max * spec.scale) + "]";
        return ERR_VALIDATION;
    }
    return ERR_NONE;
}

ErrorCode encodeChannel(const ChannelSpec& spec, const ChannelValue& value,
                        uint16_t current_word, uint16_t& out_word, std::string& reason) {
    if (!spec.writable()) {
        reason = "channel " + spec.name + " is read-only";
        return ERR_NOT_WRITABLE;
    }
    if (!value.valid) {
        reason = "no value given for " + spec.name;
        return ERR_VALIDATION;
    }

    int64_t raw = 0;
    switch (spec.type) {
        case ChannelType::UNSIGNED:
        case ChannelType::SIGNED: {
            ErrorCode err = encodeScaled(spec, value.number, raw, reason);
            if (err != ERR_NONE) return err;
            out_word = (uint16_t)(raw & 0xFFFF);
            return ERR_NONE;
        }
        case ChannelType::BOOLEAN:
            out_word = value.number != 0.0f ? spec.on_value : 0;
            return ERR_NONE;
        case ChannelType::ENUMERATION: {
            if (!value.label.empty()) {
                for (size_t i = 0; i < spec.labels.size(); ++i) {
                    if (spec.labels[i] == value.label) {
                        out_word = (uint16_t)i;
                        return ERR_NONE;
                    }
                }
                reason = "unknown option '" + value.label + "' for " + spec.name;
                return ERR_VALIDATION;
            }
            long index = lroundf(value.number);
            if (index < 0 || (size_t)index >= spec.labels.size() || (float)index != value.number) {
                reason = "option index out of range for " + spec.name;
                return ERR_VALIDATION;
            }
            out_word = (uint16_t)index;
            return ERR_NONE;
        }
        case ChannelType::BITFIELD: {
            ErrorCode err = encodeScaled(spec, value.number, raw, reason);
            if (err != ERR_NONE) return err;
            uint16_t field = (uint16_t)(((uint32_t)raw << spec.shift) & spec.mask);
            out_word = (uint16_t)((current_word & ~spec.mask) | field);
            return ERR_NONE;
        }
        case ChannelType::COLOR_TEMPERATURE:
            out_word = colorTempMiredToDevice(value.number);
            return ERR_NONE;
        case ChannelType::UNSIGNED_PAIR:
        case ChannelType::ACCUMULATOR:
            break;
    }
    reason = "channel " + spec.name + " cannot be written with a single register";
    return ERR_NOT_WRITABLE;
}
