#include "infrastructure/error_handling.h"

namespace codemend {

EngineError::EngineError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(errorToString(code)) + ": " + message), code_(code) {}

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::SANDBOX_UNAVAILABLE: return "Sandbox unavailable";
        case ErrorCode::TIMEOUT: return "Timeout";
        case ErrorCode::NON_ZERO_EXIT: return "Non-zero exit";
        case ErrorCode::CLASSIFIED_RUNTIME_ERROR: return "Runtime error";
        case ErrorCode::REPAIR_FAILED: return "Repair failed";
        case ErrorCode::INVALID_FILE_SET: return "Invalid file set";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "ok";
        case ErrorCode::SANDBOX_UNAVAILABLE: return "sandbox_unavailable";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::NON_ZERO_EXIT: return "non_zero_exit";
        case ErrorCode::CLASSIFIED_RUNTIME_ERROR: return "classified_runtime_error";
        case ErrorCode::REPAIR_FAILED: return "repair_failed";
        case ErrorCode::INVALID_FILE_SET: return "invalid_file_set";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
        default: return "unknown";
    }
}

bool isRetryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::TIMEOUT:
        case ErrorCode::NON_ZERO_EXIT:
        case ErrorCode::CLASSIFIED_RUNTIME_ERROR:
        case ErrorCode::REPAIR_FAILED:
        case ErrorCode::INTERNAL_ERROR:
            return true;
        default:
            return false;
    }
}

std::string Error::describe() const {
    std::string out = std::string(errorToString(code)) + ": " + message;
    if (!context.empty()) out += " [" + context + "]";
    return out;
}

void throwIfError(const Error& error) {
    if (error.ok()) return;
    std::string msg = error.message;
    if (!error.context.empty()) msg += " [" + error.context + "]";
    throw EngineError(error.code, msg);
}

Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}
