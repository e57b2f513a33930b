#include "core/execution_state.h"
#include "sandbox/workspace.h"

namespace codemend {
namespace core {

const char* fileStatusName(FileStatus status) {
    switch (status) {
        case FileStatus::PENDING: return "pending";
        case FileStatus::NEEDS_REPAIR: return "needs_repair";
        case FileStatus::REPAIRED: return "repaired";
        case FileStatus::DONE: return "done";
        case FileStatus::EXHAUSTED: return "exhausted";
        default: return "unknown";
    }
}

ExecutionState::ExecutionState(int maxFixAttempts) : maxFixAttempts(maxFixAttempts) {
    CODEMEND_REQUIRE(maxFixAttempts >= 1, ErrorCode::INVALID_ARGUMENT,
                     "maxFixAttempts must be at least 1, got " + std::to_string(maxFixAttempts));
}

bool ExecutionState::needsRevision() const {
    if (hasFatal()) return false;
    for (const auto& [path, errs] : errors) {
        if (attemptsOf(path) < maxFixAttempts) return true;
    }
    return false;
}

FileStatus ExecutionState::statusOf(const std::string& path) const {
    auto it = status.find(path);
    return it != status.end() ? it->second : FileStatus::PENDING;
}

int ExecutionState::attemptsOf(const std::string& path) const {
    auto it = fixAttempts.find(path);
    return it != fixAttempts.end() ? it->second : 0;
}

bool ExecutionState::isTerminal(const std::string& path) const {
    FileStatus s = statusOf(path);
    return s == FileStatus::DONE || s == FileStatus::EXHAUSTED;
}

void ExecutionState::recordResult(const std::string& path, const sandbox::ExecutionResult& result) {
    results[path] = result;
    history.push_back(AttemptRecord{path, cycles, attemptsOf(path), result});

    if (result.success()) {
        errors.erase(path);
        status[path] = FileStatus::DONE;
        return;
    }

    std::vector<std::string> errs = result.errors();
    if (errs.empty()) errs.push_back(result.errorSummary());
    errors[path] = std::move(errs);
    fixAttempts.emplace(path, 0);
    status[path] = attemptsOf(path) >= maxFixAttempts ? FileStatus::EXHAUSTED : FileStatus::NEEDS_REPAIR;
}

void ExecutionState::recordRepair(const std::string& path, bool applied, ErrorCode code, const std::string& message) {
    int attempt = ++fixAttempts[path];
    repairs.push_back(RepairRecord{path, attempt, applied, code, message});
    status[path] = FileStatus::REPAIRED;
}

void ExecutionState::markPending(const std::string& path) {
    status[path] = FileStatus::PENDING;
}

size_t ExecutionState::successCount() const {
    size_t count = 0;
    for (const auto& [path, result] : results) {
        if (result.success()) count++;
    }
    return count;
}

std::vector<std::string> ExecutionState::failedFiles() const {
    std::vector<std::string> failed;
    for (const auto& [path, errs] : errors) {
        failed.push_back(path);
    }
    return failed;
}

ErrorCode classifyFailure(const sandbox::ExecutionResult& result) {
    return result.failureKind();
}

bool isValidFilePath(const std::string& path) {
    return sandbox::Workspace::isSafeRelativePath(path);
}

void validateFileSet(const FileSet& files) {
    for (const auto& [path, content] : files) {
        CODEMEND_REQUIRE(isValidFilePath(path), ErrorCode::INVALID_FILE_SET,
                         "Invalid file path in file set: '" + path + "'");
    }
}

}
}
