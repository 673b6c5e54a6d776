#pragma once
#include <stdint.h>
#include <mutex>
#include <string>
#include "errors.hpp"
#include "error_classifier.hpp"
#include "modbus_frame.hpp"
#include "transport.hpp"

// Register-level access to one device. Every call is exactly one
// exchange; nothing is retried here (the poll cadence is the retry).
class ProtocolAdapter {
public:
    ProtocolAdapter(Transport* transport, ErrorClassifier* classifier, uint32_t timeout_ms);
    ~ProtocolAdapter() = default;

    // Read holding registers into values[0..num_registers)
    ErrorCode readRegisters(uint16_t start_address, uint16_t num_registers, uint16_t* values);

    // Write single register
    ErrorCode writeRegister(uint16_t register_address, uint16_t value);

    void setTimeout(uint32_t timeout_ms) { timeout_ms_ = timeout_ms; }
    uint32_t getTimeout() const { return timeout_ms_; }

    // Details of the most recent failure, for logs and command results.
    std::string getLastErrorDetails() const;

private:
    uint16_t nextTransactionId();
    ErrorCode fail(const Fault& fault);

    Transport* transport_;
    ErrorClassifier* classifier_;
    uint32_t timeout_ms_;
    uint16_t transaction_id_ = 0;
    std::string last_error_;
    mutable std::mutex mutex_;
};
