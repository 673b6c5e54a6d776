#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

// SiHAS datagram framing (a Modbus/TCP-like header with an 8-bit sum).
//
//  0-1  transaction id (big-endian, 1..255)
//  2-3  0x0000
//  4-5  data length
//  6    checksum of bytes 0..5
//  7    function code
//  8..  payload (big-endian words)

static const uint16_t SIHAS_UDP_PORT = 502;

static const uint8_t FC_READ_HOLDING_REGISTERS = 0x03;
static const uint8_t FC_WRITE_SINGLE_REGISTER = 0x06;
// Set in the response function code when the device refuses remote control.
static const uint8_t FC_DEVICE_REFUSED_FLAG = 0x08;

static const size_t FRAME_HEADER_LENGTH = 7;
static const size_t FRAME_FUNCTION_CODE_POS = 7;
static const size_t FRAME_REQUEST_LENGTH = 12;
static const uint16_t FRAME_REQUEST_DATA_LENGTH = 6;

enum class FrameStatus {
    OK,
    TOO_SHORT,
    LENGTH_MISMATCH,
    FUNCTION_MISMATCH
};

const char* frameStatusToString(FrameStatus status);

// Sum of the bytes modulo 256.
uint8_t frame_checksum(const uint8_t* data, size_t length);

// Rolling transaction id, 1..255 then back to 1.
uint16_t next_transaction_id(uint16_t previous);

std::vector<uint8_t> build_read_request(uint16_t transaction_id, uint16_t start, uint16_t count);
std::vector<uint8_t> build_write_request(uint16_t transaction_id, uint16_t address, uint16_t value);

// 0 when the frame is shorter than a header.
uint16_t frame_transaction_id(const std::vector<uint8_t>& frame);
// Raw function code byte, 0 when absent.
uint8_t frame_function_code(const std::vector<uint8_t>& frame);

// Expected size of a read response carrying `count` registers.
size_t read_response_length(uint16_t count);

// Structural checks only; the byte count field is not trusted, the datagram
// length is. Device refusal (FC_DEVICE_REFUSED_FLAG) is
// interpreted by ErrorClassifier before these run.
FrameStatus check_read_response(const std::vector<uint8_t>& frame, uint16_t count);
FrameStatus check_write_response(const std::vector<uint8_t>& frame);

// Copies `count` big-endian words out of a validated read response.
void extract_registers(const std::vector<uint8_t>& frame, uint16_t count, uint16_t* out);
