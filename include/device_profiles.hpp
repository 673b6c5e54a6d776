#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "errors.hpp"
#include "register_codec.hpp"

enum class DeviceType {
    ACM,    // AC IR remote controller
    BCM,    // boiler controller
    TCM,    // fan-coil thermostat
    STM,    // light switch
    SBM,    // light switch (button)
    SDM,    // dimmer
    CCM,    // smart plug with metering
    PMM,    // power meter
    AQM,    // air quality sensor
    RBM     // roller blind
};

// One contiguous read request.
struct ReadBlock {
    RegisterAddress start;
    uint16_t count;
};

// Devices answer reads in aligned 64-register windows.
static const uint16_t READ_WINDOW_REGISTERS = 64;

struct CapabilitySet {
    DeviceType type = DeviceType::ACM;
    uint32_t config_code = 0;
    std::vector<ChannelSpec> channels;
    std::vector<ReadBlock> read_blocks;
    uint32_t default_poll_interval_ms = 0;

    const ChannelSpec* findChannel(const std::string& name) const;
    // Highest register address any channel touches, plus one.
    uint16_t registerSpan() const;
};

const char* deviceTypeToTag(DeviceType type);
// Accepts "ACM", "acm", ...
bool deviceTypeFromTag(const std::string& tag, DeviceType& out);
// Device type byte carried in SiHAS packets (ACM = 7, PMM = 17, ...).
bool deviceTypeFromCode(uint8_t code, DeviceType& out);
uint8_t deviceTypeCode(DeviceType type);

// Pure: the same (type, config_code) always yields the same set.
// ERR_UNKNOWN_PROFILE when the combination is not modeled.
ErrorCode resolveProfile(DeviceType type, uint32_t config_code, CapabilitySet& out);
ErrorCode resolveProfile(const std::string& type_tag, uint32_t config_code, CapabilitySet& out);

// Minimum set of aligned windows covering every channel register.
std::vector<ReadBlock> planReadBlocks(const std::vector<ChannelSpec>& channels);
