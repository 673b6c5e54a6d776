#pragma once

#include <stdint.h>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_TIMEOUT,               // no answer within the exchange deadline
    ERR_FEATURE_DISABLED,      // device refuses remote control (app setting)
    ERR_MALFORMED_RESPONSE,    // answer does not match the request shape
    ERR_UNKNOWN_PROFILE,       // device type + config code not modeled
    ERR_NOT_WRITABLE,          // unknown or read-only channel
    ERR_VALIDATION,            // value out of range / unknown label
    ERR_CONFIG,                // bad setup parameters (interval, address, MAC)
    ERR_UNKNOWN_DEVICE         // handle not registered
};

// What the caller is expected to do about an error.
enum class RecoveryAction {
    NONE,
    RETRY_NEXT_CYCLE,
    SURFACE_TO_USER,
    ABORT_SETUP
};

const char* errorCodeToString(ErrorCode code);
const char* recoveryActionToString(RecoveryAction action);
