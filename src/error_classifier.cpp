#include "../include/error_classifier.hpp"
#include "../include/modbus_frame.hpp"
#include "../include/logger.hpp"
#include <cstdio>
#include <cstring>

static const size_t FAULT_KINDS = ERR_UNKNOWN_DEVICE + 1;

ErrorClassifier::ErrorClassifier(const std::string& device_label)
    : device_label_(device_label) {
    memset(fault_counts_, 0, sizeof(fault_counts_));
}

RecoveryAction ErrorClassifier::recoveryFor(ErrorCode code) {
    switch (code) {
        case ERR_NONE:
            return RecoveryAction::NONE;
        case ERR_TIMEOUT:
        case ERR_MALFORMED_RESPONSE:
            return RecoveryAction::RETRY_NEXT_CYCLE;
        case ERR_FEATURE_DISABLED:
        case ERR_NOT_WRITABLE:
        case ERR_VALIDATION:
        case ERR_UNKNOWN_DEVICE:
            return RecoveryAction::SURFACE_TO_USER;
        case ERR_UNKNOWN_PROFILE:
        case ERR_CONFIG:
            return RecoveryAction::ABORT_SETUP;
        default:
            return RecoveryAction::SURFACE_TO_USER;
    }
}

Fault ErrorClassifier::record(ErrorCode code, const std::string& details) {
    Fault fault;
    fault.code = code;
    fault.action = recoveryFor(code);
    fault.details = details;
    if (code == ERR_NONE) return fault;

    {
        std::lock_guard<std::mutex> lock(counters_mutex_);
        total_faults_++;
        if ((size_t)code < FAULT_KINDS) fault_counts_[code]++;
    }

    if (fault.action == RecoveryAction::RETRY_NEXT_CYCLE) {
        Logger::debug("[Classifier] %s: %s (%s)", device_label_.c_str(),
                      errorCodeToString(code), details.c_str());
    } else {
        Logger::warn("[Classifier] %s: %s (%s) -> %s", device_label_.c_str(),
                     errorCodeToString(code), details.c_str(), recoveryActionToString(fault.action));
    }
    return fault;
}

Fault ErrorClassifier::classifyTransport(TransportStatus status) {
    switch (status) {
        case TransportStatus::OK:
            return record(ERR_NONE, "");
        case TransportStatus::TIMEOUT:
            return record(ERR_TIMEOUT, "no response before deadline");
        case TransportStatus::SEND_FAILED:
            return record(ERR_TIMEOUT, "request could not be sent");
        case TransportStatus::CANCELLED:
            return record(ERR_TIMEOUT, "exchange cancelled");
        default:
            return record(ERR_TIMEOUT, "unknown transport status");
    }
}

// A function code with the refusal flag means remote control is switched
// off in the device's own app. The check runs before any size check since a
// refusal is short.
static bool deviceRefused(const std::vector<uint8_t>& frame) {
    return frame.size() > FRAME_FUNCTION_CODE_POS &&
           (frame[FRAME_FUNCTION_CODE_POS] & FC_DEVICE_REFUSED_FLAG) != 0;
}

Fault ErrorClassifier::classifyReadResponse(const std::vector<uint8_t>& frame, uint16_t count) {
    if (deviceRefused(frame)) {
        return record(ERR_FEATURE_DISABLED, "remote control disabled in the device app");
    }
    FrameStatus status = check_read_response(frame, count);
    if (status != FrameStatus::OK) {
        char details[64];
        snprintf(details, sizeof(details), "%s, %u bytes (expected %u)", frameStatusToString(status),
                 (unsigned)frame.size(), (unsigned)read_response_length(count));
        return record(ERR_MALFORMED_RESPONSE, details);
    }
    return record(ERR_NONE, "");
}

Fault ErrorClassifier::classifyWriteResponse(const std::vector<uint8_t>& frame) {
    if (deviceRefused(frame)) {
        return record(ERR_FEATURE_DISABLED, "remote control disabled in the device app");
    }
    FrameStatus status = check_write_response(frame);
    if (status != FrameStatus::OK) {
        return record(ERR_MALFORMED_RESPONSE, frameStatusToString(status));
    }
    return record(ERR_NONE, "");
}

Fault ErrorClassifier::classifySetup(ErrorCode code, const std::string& details) {
    return record(code, details);
}

uint32_t ErrorClassifier::getFaultCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    if ((size_t)code >= FAULT_KINDS) return 0;
    return fault_counts_[code];
}

uint32_t ErrorClassifier::getTotalFaults() const {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    return total_faults_;
}

void ErrorClassifier::resetCounters() {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    total_faults_ = 0;
    memset(fault_counts_, 0, sizeof(fault_counts_));
}

void ErrorClassifier::getStatistics(char* outBuf, size_t outBufSize) const {
    std::lock_guard<std::mutex> lock(counters_mutex_);
    snprintf(outBuf, outBufSize, "faults=%lu timeout=%lu disabled=%lu malformed=%lu",
             (unsigned long)total_faults_,
             (unsigned long)fault_counts_[ERR_TIMEOUT],
             (unsigned long)fault_counts_[ERR_FEATURE_DISABLED],
             (unsigned long)fault_counts_[ERR_MALFORMED_RESPONSE]);
}
