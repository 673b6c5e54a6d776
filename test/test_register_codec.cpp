/**
 * Register codec test program.
 *
 * Upload to an ESP32 and watch the serial monitor for the Unity summary.
 */

#include <Arduino.h>
#include <unity.h>
#include "../include/register_codec.hpp"

void setUp(void) {}
void tearDown(void) {}

static RegisterBank bankWith(RegisterAddress address, uint16_t word) {
    RegisterBank bank(64, 0);
    bank[address] = word;
    return bank;
}

static ChannelSpec colorTemp() {
    ChannelSpec c;
    c.name = "color_temp_1";
    c.address = 1;
    c.type = ChannelType::COLOR_TEMPERATURE;
    c.raw_max = DEVICE_COLOR_TEMP_MAX;
    c.access = ChannelAccess::READ_WRITE;
    return c;
}

void test_color_temp_end_points(void) {
    TEST_ASSERT_EQUAL_FLOAT(500.0f, colorTempDeviceToMired(0));
    TEST_ASSERT_EQUAL_FLOAT(154.0f, colorTempDeviceToMired(100));
    TEST_ASSERT_EQUAL_UINT16(0, colorTempMiredToDevice(500.0f));
    TEST_ASSERT_EQUAL_UINT16(100, colorTempMiredToDevice(154.0f));
}

void test_color_temp_clamps_out_of_range_input(void) {
    TEST_ASSERT_EQUAL_FLOAT(154.0f, colorTempDeviceToMired(250));
    TEST_ASSERT_EQUAL_FLOAT(500.0f, colorTempDeviceToMired(-5));
    TEST_ASSERT_EQUAL_UINT16(100, colorTempMiredToDevice(100.0f));
    TEST_ASSERT_EQUAL_UINT16(0, colorTempMiredToDevice(700.0f));
}

void test_color_temp_device_values_survive_conversion(void) {
    for (int32_t v = 0; v <= 100; ++v) {
        TEST_ASSERT_EQUAL_UINT16(v, colorTempMiredToDevice(colorTempDeviceToMired(v)));
    }
}

void test_color_temp_channel_decodes_to_mired(void) {
    ChannelValue v = decodeChannel(colorTemp(), bankWith(1, 50));
    TEST_ASSERT_TRUE(v.valid);
    TEST_ASSERT_EQUAL_FLOAT(327.0f, v.number);

    std::string reason;
    uint16_t word = 0;
    TEST_ASSERT_EQUAL(ERR_NONE, encodeChannel(colorTemp(), ChannelValue::fromNumber(154.0f), 0, word, reason));
    TEST_ASSERT_EQUAL_UINT16(100, word);
}

void test_scaled_channel_decodes_and_encodes(void) {
    ChannelSpec c;
    c.name = "target_temperature";
    c.address = 1;
    c.scale = 0.1f;
    c.raw_min = 0;
    c.raw_max = 800;
    c.access = ChannelAccess::READ_WRITE;

    ChannelValue v = decodeChannel(c, bankWith(1, 235));
    TEST_ASSERT_TRUE(v.valid);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 23.5f, v.number);

    std::string reason;
    uint16_t word = 0;
    TEST_ASSERT_EQUAL(ERR_NONE, encodeChannel(c, ChannelValue::fromNumber(21.5f), 0, word, reason));
    TEST_ASSERT_EQUAL_UINT16(215, word);

    TEST_ASSERT_EQUAL(ERR_VALIDATION, encodeChannel(c, ChannelValue::fromNumber(81.0f), 0, word, reason));
    TEST_ASSERT_FALSE(decodeChannel(c, bankWith(1, 900)).valid);
}

void test_signed_channel_decodes_negative_values(void) {
    ChannelSpec c;
    c.name = "temperature";
    c.type = ChannelType::SIGNED;
    c.scale = 0.1f;
    c.raw_min = -400;
    c.raw_max = 1250;

    ChannelValue v = decodeChannel(c, bankWith(0, (uint16_t)(int16_t)-55));
    TEST_ASSERT_TRUE(v.valid);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, -5.5f, v.number);
}

void test_enumeration_uses_labels(void) {
    ChannelSpec c;
    c.name = "fan_mode";
    c.address = 3;
    c.type = ChannelType::ENUMERATION;
    c.labels = {"low", "medium", "high"};
    c.raw_max = 2;
    c.access = ChannelAccess::READ_WRITE;

    ChannelValue v = decodeChannel(c, bankWith(3, 2));
    TEST_ASSERT_TRUE(v.valid);
    TEST_ASSERT_EQUAL_STRING("high", v.label.c_str());
    TEST_ASSERT_FALSE(decodeChannel(c, bankWith(3, 7)).valid);

    std::string reason;
    uint16_t word = 0;
    TEST_ASSERT_EQUAL(ERR_NONE, encodeChannel(c, ChannelValue::fromLabel("medium"), 0, word, reason));
    TEST_ASSERT_EQUAL_UINT16(1, word);
    TEST_ASSERT_EQUAL(ERR_VALIDATION, encodeChannel(c, ChannelValue::fromLabel("turbo"), 0, word, reason));
}

void test_bitfield_write_keeps_other_bits(void) {
    ChannelSpec c;
    c.name = "heating_enabled";
    c.address = 4;
    c.type = ChannelType::BITFIELD;
    c.mask = 0x0002;
    c.shift = 1;
    c.raw_max = 1;
    c.access = ChannelAccess::READ_WRITE;

    TEST_ASSERT_EQUAL_FLOAT(1.0f, decodeChannel(c, bankWith(4, 0x0007)).number);

    std::string reason;
    uint16_t word = 0;
    TEST_ASSERT_EQUAL(ERR_NONE, encodeChannel(c, ChannelValue::fromBool(false), 0x0007, word, reason));
    TEST_ASSERT_EQUAL_HEX16(0x0005, word);
}

void test_read_only_and_pair_channels_are_not_writable(void) {
    ChannelSpec ro;
    ro.name = "current_temperature";
    std::string reason;
    uint16_t word = 0;
    TEST_ASSERT_EQUAL(ERR_NOT_WRITABLE, encodeChannel(ro, ChannelValue::fromNumber(1.0f), 0, word, reason));

    ChannelSpec pair;
    pair.name = "energy_total";
    pair.address = 40;
    pair.type = ChannelType::UNSIGNED_PAIR;
    pair.raw_max = 0xFFFFFFFFLL;
    RegisterBank bank(64, 0);
    bank[40] = 0x0002;
    bank[41] = 0x0001;
    TEST_ASSERT_EQUAL_FLOAT(65538.0f, decodeChannel(pair, bank).number);
    pair.access = ChannelAccess::READ_WRITE;
    TEST_ASSERT_EQUAL(ERR_NOT_WRITABLE, encodeChannel(pair, ChannelValue::fromNumber(1.0f), 0, word, reason));
}

void test_boolean_writes_on_value(void) {
    ChannelSpec c;
    c.name = "light_1";
    c.type = ChannelType::BOOLEAN;
    c.on_value = 101;
    c.access = ChannelAccess::READ_WRITE;

    std::string reason;
    uint16_t word = 0;
    TEST_ASSERT_EQUAL(ERR_NONE, encodeChannel(c, ChannelValue::fromBool(true), 0, word, reason));
    TEST_ASSERT_EQUAL_UINT16(101, word);
    TEST_ASSERT_EQUAL(ERR_NONE, encodeChannel(c, ChannelValue::fromBool(false), 0, word, reason));
    TEST_ASSERT_EQUAL_UINT16(0, word);
    TEST_ASSERT_EQUAL(ERR_VALIDATION, encodeChannel(c, ChannelValue::invalid(), 0, word, reason));
}

void test_accumulator_combines_coarse_and_fine_words(void) {
    ChannelSpec c;
    c.name = "this_month_energy";
    c.address = 10;
    c.type = ChannelType::ACCUMULATOR;
    c.scale = 0.001f;
    c.multiplier = 10;
    c.range_multiplier = 100;
    c.fine_address = 16;
    c.range_address = 31;
    c.access = ChannelAccess::READ_WRITE;

    RegisterBank bank(64, 0);
    bank[10] = 500;
    bank[16] = 45;
    TEST_ASSERT_FLOAT_WITHIN(0.0005f, 5.045f, decodeChannel(c, bank).number);
    bank[31] = 1;
    TEST_ASSERT_FLOAT_WITHIN(0.005f, 50.045f, decodeChannel(c, bank).number);

    TEST_ASSERT_TRUE(channelUsesRegister(c, 16));
    TEST_ASSERT_TRUE(channelUsesRegister(c, 31));
    TEST_ASSERT_FALSE(channelUsesRegister(c, 11));
    TEST_ASSERT_EQUAL(3, channelRegisters(c).size());

    // Fine register outside the bank: no value rather than a wrong one.
    c.fine_address = 80;
    TEST_ASSERT_FALSE(decodeChannel(c, bank).valid);

    std::string reason;
    uint16_t word = 0;
    TEST_ASSERT_EQUAL(ERR_NOT_WRITABLE, encodeChannel(c, ChannelValue::fromNumber(1.0f), 0, word, reason));
}

void setup() {
    Serial.begin(115200);
    delay(2000);

    UNITY_BEGIN();
    RUN_TEST(test_color_temp_end_points);
    RUN_TEST(test_color_temp_clamps_out_of_range_input);
    RUN_TEST(test_color_temp_device_values_survive_conversion);
    RUN_TEST(test_color_temp_channel_decodes_to_mired);
    RUN_TEST(test_scaled_channel_decodes_and_encodes);
    RUN_TEST(test_signed_channel_decodes_negative_values);
    RUN_TEST(test_enumeration_uses_labels);
    RUN_TEST(test_bitfield_write_keeps_other_bits);
    RUN_TEST(test_read_only_and_pair_channels_are_not_writable);
    RUN_TEST(test_boolean_writes_on_value);
    RUN_TEST(test_accumulator_combines_coarse_and_fine_words);
    UNITY_END();
}

void loop() {}
