#include "../include/protocol_adapter.hpp"
#include "../include/logger.hpp"
#include <vector>

ProtocolAdapter::ProtocolAdapter(Transport* transport, ErrorClassifier* classifier, uint32_t timeout_ms)
    : transport_(transport), classifier_(classifier), timeout_ms_(timeout_ms) {}

uint16_t ProtocolAdapter::nextTransactionId() {
    std::lock_guard<std::mutex> lock(mutex_);
    transaction_id_ = next_transaction_id(transaction_id_);
    return transaction_id_;
}

ErrorCode ProtocolAdapter::fail(const Fault& fault) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = fault.details;
    return fault.code;
}

std::string ProtocolAdapter::getLastErrorDetails() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

ErrorCode ProtocolAdapter::readRegisters(uint16_t start_address, uint16_t num_registers, uint16_t* values) {
    Logger::debug("Reading %d registers starting from address %d", num_registers, start_address);

    std::vector<uint8_t> request = build_read_request(nextTransactionId(), start_address, num_registers);
    std::vector<uint8_t> response;

    Fault fault = classifier_->classifyTransport(transport_->exchange(request, response, timeout_ms_));
    if (fault.code != ERR_NONE) return fail(fault);

    fault = classifier_->classifyReadResponse(response, num_registers);
    if (fault.code != ERR_NONE) return fail(fault);

    extract_registers(response, num_registers, values);
    Logger::debug("Successfully read %d registers", num_registers);
    return ERR_NONE;
}

ErrorCode ProtocolAdapter::writeRegister(uint16_t register_address, uint16_t value) {
    Logger::debug("Writing value %d to register %d", value, register_address);

    std::vector<uint8_t> request = build_write_request(nextTransactionId(), register_address, value);
    std::vector<uint8_t> response;

    Fault fault = classifier_->classifyTransport(transport_->exchange(request, response, timeout_ms_));
    if (fault.code != ERR_NONE) return fail(fault);

    fault = classifier_->classifyWriteResponse(response);
    if (fault.code != ERR_NONE) return fail(fault);

    Logger::debug("Successfully wrote value %d to register %d", value, register_address);
    return ERR_NONE;
}
