/**
 * SiHAS datagram framing test program.
 */

#include <Arduino.h>
#include <unity.h>
#include "../include/modbus_frame.hpp"

void setUp(void) {}
void tearDown(void) {}

void test_read_request_layout(void) {
    std::vector<uint8_t> frame = build_read_request(0x12, 0, 64);
    const uint8_t expected[] = {0x00, 0x12, 0x00, 0x00, 0x00, 0x06, 0x18, 0x03, 0x00, 0x00, 0x00, 0x40};
    TEST_ASSERT_EQUAL(FRAME_REQUEST_LENGTH, frame.size());
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, frame.data(), sizeof(expected));
}

void test_write_request_layout(void) {
    std::vector<uint8_t> frame = build_write_request(1, 0x0002, 0x0165);
    const uint8_t expected[] = {0x00, 0x01, 0x00, 0x00, 0x00, 0x06, 0x07, 0x06, 0x00, 0x02, 0x01, 0x65};
    TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, frame.data(), sizeof(expected));
    TEST_ASSERT_EQUAL_UINT16(1, frame_transaction_id(frame));
    TEST_ASSERT_EQUAL_HEX8(FC_WRITE_SINGLE_REGISTER, frame_function_code(frame));
}

void test_checksum_wraps_at_256(void) {
    const uint8_t data[] = {0xFF, 0x02, 0x00};
    TEST_ASSERT_EQUAL_HEX8(0x01, frame_checksum(data, sizeof(data)));
}

void test_transaction_id_rolls_over(void) {
    TEST_ASSERT_EQUAL_UINT16(1, next_transaction_id(0));
    TEST_ASSERT_EQUAL_UINT16(2, next_transaction_id(1));
    TEST_ASSERT_EQUAL_UINT16(255, next_transaction_id(254));
    TEST_ASSERT_EQUAL_UINT16(1, next_transaction_id(255));
}

void test_read_response_checks(void) {
    TEST_ASSERT_EQUAL(137, read_response_length(64));

    std::vector<uint8_t> frame(137, 0);
    frame[FRAME_FUNCTION_CODE_POS] = FC_READ_HOLDING_REGISTERS;
    frame[9] = 0x12;
    frame[10] = 0x34;
    TEST_ASSERT_TRUE(check_read_response(frame, 64) == FrameStatus::OK);

    uint16_t words[64];
    extract_registers(frame, 64, words);
    TEST_ASSERT_EQUAL_HEX16(0x1234, words[0]);

    frame.pop_back();
    TEST_ASSERT_TRUE(check_read_response(frame, 64) == FrameStatus::LENGTH_MISMATCH);
    frame[FRAME_FUNCTION_CODE_POS] = FC_WRITE_SINGLE_REGISTER;
    TEST_ASSERT_TRUE(check_read_response(frame, 64) == FrameStatus::FUNCTION_MISMATCH);
    frame.resize(5);
    TEST_ASSERT_TRUE(check_read_response(frame, 64) == FrameStatus::TOO_SHORT);
    TEST_ASSERT_EQUAL_UINT16(0, frame_transaction_id(frame));
}

void setup() {
    Serial.begin(115200);
    delay(2000);

    UNITY_BEGIN();
    RUN_TEST(test_read_request_layout);
    RUN_TEST(test_write_request_layout);
    RUN_TEST(test_checksum_wraps_at_256);
    RUN_TEST(test_transaction_id_rolls_over);
    RUN_TEST(test_read_response_checks);
    UNITY_END();
}

void loop() {}
