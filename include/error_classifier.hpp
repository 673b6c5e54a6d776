#ifndef ERROR_CLASSIFIER_HPP
#define ERROR_CLASSIFIER_HPP

#include <stdint.h>
#include <mutex>
#include <string>
#include <vector>
#include "errors.hpp"
#include "transport.hpp"

/**
 * @brief Classification of one failed exchange
 */
struct Fault {
    ErrorCode code = ERR_NONE;
    RecoveryAction action = RecoveryAction::NONE;
    std::string details;
};

/**
 * @brief Error Classifier - the one place that interprets device replies
 *
 * Maps transport outcomes and response frames onto the fixed error kinds:
 * - ERR_TIMEOUT: no (usable) answer in time, retry on the next poll cycle
 * - ERR_FEATURE_DISABLED: device refuses remote control, surface to the user
 * - ERR_MALFORMED_RESPONSE: answer with the wrong shape, retry next cycle
 * - ERR_UNKNOWN_PROFILE: setup-time only, abort setup
 *
 * Keeps per-kind counters for diagnostics. One instance per device.
 */
class ErrorClassifier {
public:
    explicit ErrorClassifier(const std::string& device_label);

    /**
     * @brief Classify a transport status (OK maps to ERR_NONE)
     */
    Fault classifyTransport(TransportStatus status);

    /**
     * @brief Classify a read-holding-registers response for `count` registers
     */
    Fault classifyReadResponse(const std::vector<uint8_t>& frame, uint16_t count);

    /**
     * @brief Classify a write-single-register response
     */
    Fault classifyWriteResponse(const std::vector<uint8_t>& frame);

    /**
     * @brief Record a setup failure (unknown profile, bad parameters)
     */
    Fault classifySetup(ErrorCode code, const std::string& details);

    /**
     * @brief Recommended action for an error kind
     */
    static RecoveryAction recoveryFor(ErrorCode code);

    uint32_t getFaultCount(ErrorCode code) const;
    uint32_t getTotalFaults() const;
    void resetCounters();
    void getStatistics(char* outBuf, size_t outBufSize) const;

private:
    Fault record(ErrorCode code, const std::string& details);

    std::string device_label_;
    mutable std::mutex counters_mutex_;
    uint32_t total_faults_ = 0;
    uint32_t fault_counts_[ERR_UNKNOWN_DEVICE + 1];
};

#endif // ERROR_CLASSIFIER_HPP
