#include "sandbox/execution_result.h"
#include "utils/utils.h"
#include <algorithm>

namespace codemend {
namespace sandbox {

ExecutionResult::ExecutionResult()
    : success_(false), exitCode_(-1), duration_(0), cause_(ErrorCode::OK) {}

ExecutionResult::ExecutionResult(int exitCode,
                                 std::string stdoutText,
                                 std::string stderrText,
                                 std::chrono::milliseconds duration,
                                 std::vector<std::string> errors,
                                 std::vector<std::string> warnings)
    : success_(exitCode == 0 && errors.empty()),
      exitCode_(exitCode),
      stdout_(std::move(stdoutText)),
      stderr_(std::move(stderrText)),
      duration_(duration),
      errors_(std::move(errors)),
      warnings_(std::move(warnings)),
      cause_(ErrorCode::OK) {}

ExecutionResult ExecutionResult::failure(ErrorCode cause,
                                         const std::string& error,
                                         std::string stdoutText,
                                         std::string stderrText,
                                         std::chrono::milliseconds duration) {
    ExecutionResult result(-1, std::move(stdoutText), std::move(stderrText), duration, {error}, {});
    result.cause_ = cause;
    return result;
}

bool ExecutionResult::hasErrors() const {
    return !success_ || exitCode_ != 0 || !errors_.empty();
}

ErrorCode ExecutionResult::failureKind() const {
    if (!hasErrors()) return ErrorCode::OK;
    if (cause_ != ErrorCode::OK) return cause_;
    if (!errors_.empty()) return ErrorCode::CLASSIFIED_RUNTIME_ERROR;
    return ErrorCode::NON_ZERO_EXIT;
}

std::string ExecutionResult::errorSummary() const {
    if (!hasErrors()) return "No errors";

    std::vector<std::string> parts;
    if (exitCode_ != 0) {
        parts.push_back("Exit code: " + std::to_string(exitCode_));
    }
    if (!stderr_.empty()) {
        parts.push_back("Stderr: " + utils::Formatter::utf8Prefix(stderr_, 500));
    }
    if (!errors_.empty()) {
        std::vector<std::string> head(errors_.begin(), errors_.begin() + std::min<size_t>(errors_.size(), 3));
        parts.push_back("Errors: " + utils::Formatter::join(head, ", "));
    }
    return utils::Formatter::join(parts, " | ");
}

std::string ExecutionResult::stderrExcerpt(size_t maxChars) const {
    return utils::Formatter::utf8Prefix(stderr_, maxChars);
}

}
}
