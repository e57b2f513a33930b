#pragma once

#include "infrastructure/error_handling.h"
#include <chrono>
#include <string>
#include <vector>

namespace codemend {
namespace sandbox {

// Outcome of one sandboxed run of one entry point. Never mutated after
// construction; a re-run produces a new value that replaces the old one.
class ExecutionResult {
public:
    // A run that never happened (exit code -1, not successful).
    ExecutionResult();

    // Normal completion; success is derived as exitCode == 0 && errors.empty().
    ExecutionResult(int exitCode,
                    std::string stdoutText,
                    std::string stderrText,
                    std::chrono::milliseconds duration,
                    std::vector<std::string> errors,
                    std::vector<std::string> warnings);

    // Synthesized failure (timeout, unavailable backend, internal fault).
    // Exit code is always -1 and errors holds exactly `error`.
    static ExecutionResult failure(ErrorCode cause,
                                   const std::string& error,
                                   std::string stdoutText,
                                   std::string stderrText,
                                   std::chrono::milliseconds duration);

    bool success() const { return success_; }
    int exitCode() const { return exitCode_; }
    const std::string& stdoutText() const { return stdout_; }
    const std::string& stderrText() const { return stderr_; }
    std::chrono::milliseconds duration() const { return duration_; }
    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

    bool hasErrors() const;
    bool timedOut() const { return cause_ == ErrorCode::TIMEOUT; }

    // Maps the result onto the per-file failure taxonomy; OK when it succeeded.
    ErrorCode failureKind() const;

    // "Exit code: N | Stderr: <500 chars> | Errors: e1, e2, e3" or "No errors".
    std::string errorSummary() const;

    // First `maxChars` characters of stderr, used as repair context.
    std::string stderrExcerpt(size_t maxChars = 1000) const;

private:
    bool success_;
    int exitCode_;
    std::string stdout_;
    std::string stderr_;
    std::chrono::milliseconds duration_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
    ErrorCode cause_;
};

}
}
