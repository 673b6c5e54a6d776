#include "../include/modbus_frame.hpp"

static void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((uint8_t)((v >> 8) & 0xFF));
    out.push_back((uint8_t)(v & 0xFF));
}

static std::vector<uint8_t> build_request(uint16_t transaction_id, uint8_t function_code,
                                          uint16_t word1, uint16_t word2) {
    std::vector<uint8_t> frame;
    frame.reserve(FRAME_REQUEST_LENGTH);
    put_u16(frame, transaction_id);
    frame.push_back(0x00);
    frame.push_back(0x00);
    put_u16(frame, FRAME_REQUEST_DATA_LENGTH);
    frame.push_back(frame_checksum(frame.data(), frame.size()));
    frame.push_back(function_code);
    put_u16(frame, word1);
    put_u16(frame, word2);
    return frame;
}

const char* frameStatusToString(FrameStatus status) {
    switch (status) {
        case FrameStatus::OK: return "OK";
        case FrameStatus::TOO_SHORT: return "TOO_SHORT";
        case FrameStatus::LENGTH_MISMATCH: return "LENGTH_MISMATCH";
        case FrameStatus::FUNCTION_MISMATCH: return "FUNCTION_MISMATCH";
        default: return "UNKNOWN";
    }
}

uint8_t frame_checksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;
    for (size_t i = 0; i < length; ++i) {
        sum += data[i];
    }
    return (uint8_t)(sum & 0xFF);
}

uint16_t next_transaction_id(uint16_t previous) {
    if (previous >= 0xFF) return 1;
    return (uint16_t)(previous + 1);
}

std::vector<uint8_t> build_read_request(uint16_t transaction_id, uint16_t start, uint16_t count) {
    return build_request(transaction_id, FC_READ_HOLDING_REGISTERS, start, count);
}

std::vector<uint8_t> build_write_request(uint16_t transaction_id, uint16_t address, uint16_t value) {
    return build_request(transaction_id, FC_WRITE_SINGLE_REGISTER, address, value);
}

uint16_t frame_transaction_id(const std::vector<uint8_t>& frame) {
    if (frame.size() < FRAME_HEADER_LENGTH) return 0;
    return (uint16_t)((frame[0] << 8) | frame[1]);
}

uint8_t frame_function_code(const std::vector<uint8_t>& frame) {
    if (frame.size() <= FRAME_FUNCTION_CODE_POS) return 0;
    return frame[FRAME_FUNCTION_CODE_POS];
}

size_t read_response_length(uint16_t count) {
    // header + function code + byte count + data
    return FRAME_HEADER_LENGTH + 2 + (size_t)count * 2;
}

FrameStatus check_read_response(const std::vector<uint8_t>& frame, uint16_t count) {
    if (frame.size() < FRAME_HEADER_LENGTH + 2) return FrameStatus::TOO_SHORT;
    if (frame[FRAME_FUNCTION_CODE_POS] != FC_READ_HOLDING_REGISTERS) return FrameStatus::FUNCTION_MISMATCH;
    if (frame.size() != read_response_length(count)) return FrameStatus::LENGTH_MISMATCH;
    return FrameStatus::OK;
}

FrameStatus check_write_response(const std::vector<uint8_t>& frame) {
    if (frame.size() < FRAME_HEADER_LENGTH + 1) return FrameStatus::TOO_SHORT;
    if (frame[FRAME_FUNCTION_CODE_POS] != FC_WRITE_SINGLE_REGISTER) return FrameStatus::FUNCTION_MISMATCH;
    return FrameStatus::OK;
}

void extract_registers(const std::vector<uint8_t>& frame, uint16_t count, uint16_t* out) {
    const size_t data_start = FRAME_HEADER_LENGTH + 2;
    for (uint16_t i = 0; i < count; ++i) {
        size_t offset = data_start + (size_t)i * 2;
        out[i] = (uint16_t)((frame[offset] << 8) | frame[offset + 1]);
    }
}
