#include "../include/device_profiles.hpp"
#include <algorithm>
#include <cctype>
#include <set>

static const uint32_t CONTROL_POLL_INTERVAL_MS = 5000;
static const uint32_t SENSOR_POLL_INTERVAL_MS = 10000;

// ---- channel builders -------------------------------------------------------

static ChannelSpec numberChannel(const std::string& name, RegisterAddress address, float scale,
                                 int64_t raw_min, int64_t raw_max, const char* unit,
                                 ChannelAccess access = ChannelAccess::READ_ONLY) {
    ChannelSpec c;
    c.name = name;
    c.address = address;
    c.type = ChannelType::UNSIGNED;
    c.scale = scale;
    c.raw_min = raw_min;
    c.raw_max = raw_max;
    c.unit = unit;
    c.access = access;
    return c;
}

static ChannelSpec signedChannel(const std::string& name, RegisterAddress address, float scale,
                                 int64_t raw_min, int64_t raw_max, const char* unit) {
    ChannelSpec c = numberChannel(name, address, scale, raw_min, raw_max, unit);
    c.type = ChannelType::SIGNED;
    return c;
}

static ChannelSpec boolChannel(const std::string& name, RegisterAddress address,
                               ChannelAccess access, uint16_t on_value = 1) {
    ChannelSpec c;
    c.name = name;
    c.address = address;
    c.type = ChannelType::BOOLEAN;
    c.raw_max = 1;
    c.on_value = on_value;
    c.access = access;
    return c;
}

static ChannelSpec enumChannel(const std::string& name, RegisterAddress address,
                               const std::vector<std::string>& labels, ChannelAccess access) {
    ChannelSpec c;
    c.name = name;
    c.address = address;
    c.type = ChannelType::ENUMERATION;
    c.raw_max = (int64_t)labels.size() - 1;
    c.labels = labels;
    c.access = access;
    return c;
}

static ChannelSpec bitChannel(const std::string& name, RegisterAddress address, uint8_t bit) {
    ChannelSpec c;
    c.name = name;
    c.address = address;
    c.type = ChannelType::BITFIELD;
    c.mask = (uint16_t)(1u << bit);
    c.shift = bit;
    c.raw_max = 1;
    return c;
}

static ChannelSpec pairChannel(const std::string& name, RegisterAddress low_address, float scale,
                               const char* unit) {
    ChannelSpec c;
    c.name = name;
    c.address = low_address;
    c.type = ChannelType::UNSIGNED_PAIR;
    c.scale = scale;
    c.raw_max = 0xFFFFFFFFLL;
    c.unit = unit;
    return c;
}

static ChannelSpec colorTempChannel(const std::string& name, RegisterAddress address) {
    ChannelSpec c;
    c.name = name;
    c.address = address;
    c.type = ChannelType::COLOR_TEMPERATURE;
    c.raw_max = DEVICE_COLOR_TEMP_MAX;
    c.unit = "mired";
    c.access = ChannelAccess::READ_WRITE;
    return c;
}

static std::string indexed(const char* base, uint32_t index) {
    return std::string(base) + "_" + std::to_string(index);
}

// ---- per-type layouts -------------------------------------------------------

static bool buildAcm(uint32_t cfg, std::vector<ChannelSpec>& out) {
    if (cfg > 1) return false;
    out.push_back(boolChannel("power", 0, ChannelAccess::READ_WRITE));
    out.push_back(numberChannel("target_temperature", 1, 1.0f, 18, 30, "C", ChannelAccess::READ_WRITE));
    out.push_back(enumChannel("mode", 2, {"cool", "dry", "fan_only", "auto", "heat"}, ChannelAccess::READ_WRITE));
    out.push_back(enumChannel("fan_mode", 3, {"low", "medium", "high"}, ChannelAccess::READ_WRITE));
    out.push_back(enumChannel("swing_mode", 4, {"off", "vertical", "horizontal", "both"}, ChannelAccess::READ_WRITE));
    // Executes a learned remote button; see learned_buttons for which exist.
    out.push_back(numberChannel("remote_button", 5, 1.0f, 0, 19, "", ChannelAccess::READ_WRITE));
    if (cfg == 1) {
        out.push_back(numberChannel("current_temperature", 6, 0.1f, 0, 0xFFFF, "C"));
    }
    out.push_back(boolChannel("vibration", 7, ChannelAccess::READ_ONLY));
    out.push_back(pairChannel("learned_buttons", 54, 1.0f, ""));
    return true;
}

static bool buildBcm(uint32_t, std::vector<ChannelSpec>& out) {
    out.push_back(boolChannel("power", 0, ChannelAccess::READ_WRITE));
    out.push_back(numberChannel("room_target_temperature", 1, 1.0f, 0, 80, "C", ChannelAccess::READ_WRITE));
    out.push_back(numberChannel("floor_target_temperature", 2, 1.0f, 0, 80, "C", ChannelAccess::READ_WRITE));
    out.push_back(numberChannel("hot_water_target_temperature", 3, 1.0f, 0, 80, "C", ChannelAccess::READ_WRITE));
    out.push_back(bitChannel("hot_water_enabled", 4, 0));
    out.push_back(bitChannel("heating_enabled", 4, 1));
    out.push_back(bitChannel("floor_heating_mode", 4, 2));
    out.push_back(boolChannel("away_mode", 5, ChannelAccess::READ_WRITE));
    out.push_back(boolChannel("timer_mode", 6, ChannelAccess::READ_WRITE));
    out.push_back(numberChannel("timer_schedule", 7, 1.0f, 0, 0xFFFF, ""));
    out.push_back(numberChannel("room_temperature", 8, 0.1f, 0, 0xFFFF, "C"));
    out.push_back(numberChannel("floor_temperature", 9, 1.0f, 0, 0xFFFF, "C"));
    out.push_back(numberChannel("hot_water_temperature", 10, 1.0f, 0, 0xFFFF, "C"));
    out.push_back(boolChannel("burner_active", 11, ChannelAccess::READ_ONLY));
    out.push_back(numberChannel("error_code", 12, 1.0f, 0, 0xFFFF, ""));
    out.push_back(boolChannel("water_refill_needed", 13, ChannelAccess::READ_ONLY));
    out.push_back(boolChannel("boiler_offline", 14, ChannelAccess::READ_ONLY));
    out.push_back(enumChannel("manufacturer", 15,
                              {"kyungdong", "kiturami", "daesung", "rinnai", "dmax", "reserved1", "reserved2"},
                              ChannelAccess::READ_ONLY));
    return true;
}

static bool buildTcm(uint32_t, std::vector<ChannelSpec>& out) {
    out.push_back(boolChannel("power", 0, ChannelAccess::READ_WRITE));
    out.push_back(numberChannel("target_temperature", 1, 0.1f, 0, 800, "C", ChannelAccess::READ_WRITE));
    out.push_back(enumChannel("away_mode", 2, {"indoor", "outdoor"}, ChannelAccess::READ_WRITE));
    out.push_back(numberChannel("current_temperature", 3, 0.1f, 0, 0xFFFF, "C"));
    out.push_back(boolChannel("valve_open", 4, ChannelAccess::READ_ONLY));
    out.push_back(numberChannel("alarm", 5, 1.0f, 0, 0xFFFF, ""));
    out.push_back(enumChannel("fan_mode", 6, {"auto", "low", "middle", "high"}, ChannelAccess::READ_WRITE));
    out.push_back(enumChannel("run_mode", 7, {"heating", "cooling"}, ChannelAccess::READ_WRITE));
    out.push_back(boolChannel("locked", 8, ChannelAccess::READ_WRITE));
    return true;
}

static bool buildSwitch(uint32_t cfg, std::vector<ChannelSpec>& out) {
    if (cfg < 1 || cfg > 3) return false;
    for (uint32_t gang = 1; gang <= cfg; ++gang) {
        out.push_back(boolChannel(indexed("switch", gang), (RegisterAddress)(gang - 1), ChannelAccess::READ_WRITE));
    }
    return true;
}

// Low three bits: number of gangs. Bit 3: tunable white.
static bool buildSdm(uint32_t cfg, std::vector<ChannelSpec>& out) {
    uint32_t gangs = cfg & 0x07;
    bool color_temp = (cfg & 0x08) != 0;
    if ((cfg & ~0x0Fu) != 0 || gangs < 1 || gangs > 3) return false;
    for (uint32_t gang = 1; gang <= gangs; ++gang) {
        RegisterAddress base = (RegisterAddress)((gang - 1) * 2);
        // Writing 101 switches on at the last used brightness.
        out.push_back(boolChannel(indexed("light", gang), base, ChannelAccess::READ_WRITE, 101));
        out.push_back(numberChannel(indexed("brightness", gang), base, 1.0f, 0, 100, "%", ChannelAccess::READ_WRITE));
        if (color_temp) {
            out.push_back(colorTempChannel(indexed("color_temp", gang), (RegisterAddress)(base + 1)));
        }
    }
    return true;
}

static bool buildCcm(uint32_t, std::vector<ChannelSpec>& out) {
    out.push_back(boolChannel("power", 0, ChannelAccess::READ_WRITE));
    out.push_back(numberChannel("voltage", 1, 0.01f, 0, 0xFFFF, "V"));
    out.push_back(numberChannel("current", 2, 0.001f, 0, 0xFFFF, "A"));
    out.push_back(numberChannel("active_power", 3, 0.1f, 0, 0xFFFF, "W"));
    out.push_back(numberChannel("power_factor", 4, 0.1f, 0, 1000, "%"));
    return true;
}

// Coarse word in 10 Wh steps (100 Wh while register 31 is set) plus the
// fine Wh remainder in register 16, reported in kWh.
static ChannelSpec energyChannel(const std::string& name, RegisterAddress address,
                                 int32_t fine_address, int32_t range_address) {
    ChannelSpec c;
    c.name = name;
    c.address = address;
    c.type = ChannelType::ACCUMULATOR;
    c.scale = 0.001f;
    c.multiplier = 10;
    c.range_multiplier = range_address >= 0 ? 100 : 10;
    c.fine_address = fine_address;
    c.range_address = range_address;
    c.unit = "kWh";
    return c;
}

static const RegisterAddress PMM_SUBMETER_BASE = 48;
static const int32_t PMM_FINE_ENERGY = 16;
static const int32_t PMM_ENERGY_RANGE = 31;

// cfg selects how many sub-metering channels are wired (0..3).
static bool buildPmm(uint32_t cfg, std::vector<ChannelSpec>& out) {
    if (cfg > 3) return false;
    out.push_back(numberChannel("voltage", 0, 0.1f, 0, 0xFFFF, "V"));
    out.push_back(numberChannel("current", 1, 0.01f, 0, 0xFFFF, "A"));
    out.push_back(numberChannel("active_power", 2, 1.0f, 0, 0xFFFF, "W"));
    out.push_back(numberChannel("power_factor", 3, 0.1f, 0, 1000, "%"));
    out.push_back(numberChannel("frequency", 4, 0.1f, 0, 0xFFFF, "Hz"));
    out.push_back(energyChannel("this_day_energy", 8, PMM_FINE_ENERGY, -1));
    out.push_back(energyChannel("this_month_energy", 10, PMM_FINE_ENERGY, PMM_ENERGY_RANGE));
    out.push_back(energyChannel("last_month_energy", 11, -1, PMM_ENERGY_RANGE));
    out.push_back(pairChannel("energy_total", 40, 0.001f, "kWh"));
    for (uint32_t n = 1; n <= cfg; ++n) {
        out.push_back(numberChannel(indexed("submeter_power", n),
                                    (RegisterAddress)(PMM_SUBMETER_BASE + n - 1), 0.1f, 0, 0xFFFF, "W"));
    }
    return true;
}

static bool buildAqm(uint32_t, std::vector<ChannelSpec>& out) {
    out.push_back(signedChannel("temperature", 0, 0.1f, -400, 1250, "C"));
    out.push_back(numberChannel("humidity", 1, 0.1f, 0, 1000, "%"));
    out.push_back(numberChannel("co2", 2, 1.0f, 0, 0xFFFF, "ppm"));
    out.push_back(numberChannel("pm25", 3, 1.0f, 0, 0xFFFF, "ug/m3"));
    out.push_back(numberChannel("pm10", 4, 1.0f, 0, 0xFFFF, "ug/m3"));
    out.push_back(numberChannel("tvoc", 5, 1.0f, 0, 0xFFFF, "ppb"));
    out.push_back(numberChannel("illuminance", 6, 1.0f, 0, 0xFFFF, "lx"));
    return true;
}

static bool buildRbm(uint32_t, std::vector<ChannelSpec>& out) {
    out.push_back(enumChannel("command", 0, {"close", "open", "stop"}, ChannelAccess::READ_WRITE));
    out.push_back(numberChannel("target_position", 1, 1.0f, 0, 100, "%", ChannelAccess::READ_WRITE));
    out.push_back(enumChannel("state", 2, {"closed", "open", "stopped", "closing", "opening"}, ChannelAccess::READ_ONLY));
    out.push_back(numberChannel("position", 3, 1.0f, 0, 100, "%"));
    return true;
}

// ---- registry ---------------------------------------------------------------

typedef bool (*LayoutBuilder)(uint32_t config_code, std::vector<ChannelSpec>& out);

struct ProfileEntry {
    DeviceType type;
    const char* tag;
    uint8_t type_code;
    uint32_t default_poll_interval_ms;
    // Fixed layouts ignore the code but it must still fit the CFG byte.
    LayoutBuilder build;
};

static const ProfileEntry PROFILES[] = {
    {DeviceType::ACM, "ACM", 7, CONTROL_POLL_INTERVAL_MS, buildAcm},
    {DeviceType::BCM, "BCM", 13, CONTROL_POLL_INTERVAL_MS, buildBcm},
    {DeviceType::TCM, "TCM", 2, CONTROL_POLL_INTERVAL_MS, buildTcm},
    {DeviceType::STM, "STM", 4, CONTROL_POLL_INTERVAL_MS, buildSwitch},
    {DeviceType::SBM, "SBM", 21, CONTROL_POLL_INTERVAL_MS, buildSwitch},
    {DeviceType::SDM, "SDM", 9, CONTROL_POLL_INTERVAL_MS, buildSdm},
    {DeviceType::CCM, "CCM", 5, CONTROL_POLL_INTERVAL_MS, buildCcm},
    {DeviceType::PMM, "PMM", 17, SENSOR_POLL_INTERVAL_MS, buildPmm},
    {DeviceType::AQM, "AQM", 12, SENSOR_POLL_INTERVAL_MS, buildAqm},
    {DeviceType::RBM, "RBM", 19, CONTROL_POLL_INTERVAL_MS, buildRbm},
};

static const size_t PROFILE_COUNT = sizeof(PROFILES) / sizeof(PROFILES[0]);
static const uint32_t MAX_CONFIG_CODE = 0xFF;

static const ProfileEntry* findProfile(DeviceType type) {
    for (size_t i = 0; i < PROFILE_COUNT; ++i) {
        if (PROFILES[i].type == type) return &PROFILES[i];
    }
    return nullptr;
}

const ChannelSpec* CapabilitySet::findChannel(const std::string& name) const {
    for (const auto& channel : channels) {
        if (channel.name == name) return &channel;
    }
    return nullptr;
}

uint16_t CapabilitySet::registerSpan() const {
    uint16_t span = 0;
    for (const auto& channel : channels) {
        for (RegisterAddress address : channelRegisters(channel)) {
            if ((uint16_t)(address + 1) > span) span = (uint16_t)(address + 1);
        }
    }
    return span;
}

const char* deviceTypeToTag(DeviceType type) {
    const ProfileEntry* entry = findProfile(type);
    return entry ? entry->tag : "UNKNOWN";
}

bool deviceTypeFromTag(const std::string& tag, DeviceType& out) {
    std::string upper(tag);
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    for (size_t i = 0; i < PROFILE_COUNT; ++i) {
        if (upper == PROFILES[i].tag) {
            out = PROFILES[i].type;
            return true;
        }
    }
    return false;
}

bool deviceTypeFromCode(uint8_t code, DeviceType& out) {
    for (size_t i = 0; i < PROFILE_COUNT; ++i) {
        if (PROFILES[i].type_code == code) {
            out = PROFILES[i].type;
            return true;
        }
    }
    return false;
}

uint8_t deviceTypeCode(DeviceType type) {
    const ProfileEntry* entry = findProfile(type);
    return entry ? entry->type_code : 0;
}

std::vector<ReadBlock> planReadBlocks(const std::vector<ChannelSpec>& channels) {
    std::set<uint16_t> windows;
    for (const auto& channel : channels) {
        for (RegisterAddress address : channelRegisters(channel)) {
            windows.insert((uint16_t)(address / READ_WINDOW_REGISTERS));
        }
    }
    std::vector<ReadBlock> blocks;
    for (uint16_t window : windows) {
        ReadBlock block;
        block.start = (RegisterAddress)(window * READ_WINDOW_REGISTERS);
        block.count = READ_WINDOW_REGISTERS;
        blocks.push_back(block);
    }
    return blocks;
}

ErrorCode resolveProfile(DeviceType type, uint32_t config_code, CapabilitySet& out) {
    const ProfileEntry* entry = findProfile(type);
    if (!entry || config_code > MAX_CONFIG_CODE) return ERR_UNKNOWN_PROFILE;

    std::vector<ChannelSpec> channels;
    if (!entry->build(config_code, channels)) return ERR_UNKNOWN_PROFILE;

    out.type = type;
    out.config_code = config_code;
    out.read_blocks = planReadBlocks(channels);
    out.channels.swap(channels);
    out.default_poll_interval_ms = entry->default_poll_interval_ms;
    return ERR_NONE;
}

ErrorCode resolveProfile(const std::string& type_tag, uint32_t config_code, CapabilitySet& out) {
    DeviceType type;
    if (!deviceTypeFromTag(type_tag, type)) return ERR_UNKNOWN_PROFILE;
    return resolveProfile(type, config_code, out);
}
