#pragma once

#include <string>
#include <stdexcept>
#include <utility>

namespace codemend {

// Per-file failure kinds are retryable through the repair loop;
// SANDBOX_UNAVAILABLE ends the run; INVALID_* are caller contract violations.
enum class ErrorCode {
    OK = 0,
    SANDBOX_UNAVAILABLE,
    TIMEOUT,
    NON_ZERO_EXIT,
    CLASSIFIED_RUNTIME_ERROR,
    REPAIR_FAILED,
    INVALID_FILE_SET,
    INVALID_ARGUMENT,
    IO_ERROR,
    INTERNAL_ERROR,
    UNKNOWN
};

struct Error {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    // Usually the file path the error refers to.
    std::string context;

    Error() = default;
    Error(ErrorCode c, std::string msg, std::string ctx = "")
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    bool ok() const { return code == ErrorCode::OK; }
    std::string describe() const;
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool hasValue_;
};

// Thrown only for caller contract violations (malformed file set, bad limits).
// Execution and repair failures are reported through results, never thrown.
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

const char* errorToString(ErrorCode code);
const char* errorCodeName(ErrorCode code);
bool isRetryable(ErrorCode code);
void throwIfError(const Error& error);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define CODEMEND_REQUIRE(expr, code, msg) if (!(expr)) throw codemend::EngineError(code, msg)

}
