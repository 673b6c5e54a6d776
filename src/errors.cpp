#include "../include/errors.hpp"

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ERR_NONE: return "OK";
        case ERR_TIMEOUT: return "TIMEOUT";
        case ERR_FEATURE_DISABLED: return "FEATURE_DISABLED";
        case ERR_MALFORMED_RESPONSE: return "MALFORMED_RESPONSE";
        case ERR_UNKNOWN_PROFILE: return "UNKNOWN_PROFILE";
        case ERR_NOT_WRITABLE: return "NOT_WRITABLE";
        case ERR_VALIDATION: return "VALIDATION";
        case ERR_CONFIG: return "CONFIG";
        case ERR_UNKNOWN_DEVICE: return "UNKNOWN_DEVICE";
        default: return "UNKNOWN";
    }
}

const char* recoveryActionToString(RecoveryAction action) {
    switch (action) {
        case RecoveryAction::NONE: return "NONE";
        case RecoveryAction::RETRY_NEXT_CYCLE: return "RETRY_NEXT_CYCLE";
        case RecoveryAction::SURFACE_TO_USER: return "SURFACE_TO_USER";
        case RecoveryAction::ABORT_SETUP: return "ABORT_SETUP";
        default: return "UNKNOWN";
    }
}
