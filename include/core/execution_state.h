#pragma once

#include "infrastructure/error_handling.h"
#include "sandbox/execution_result.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace codemend {
namespace core {

// Relative path -> source. Iterated in lexical path order everywhere.
using FileSet = std::map<std::string, std::string>;
// Role ("backend", ...) -> framework names.
using TechStack = std::map<std::string, std::vector<std::string>>;

enum class FileStatus {
    PENDING,
    NEEDS_REPAIR,
    REPAIRED,
    DONE,
    EXHAUSTED
};

const char* fileStatusName(FileStatus status);

struct AttemptRecord {
    std::string path;
    int cycle;
    int fixAttempts;
    sandbox::ExecutionResult result;
};

struct RepairRecord {
    std::string path;
    int attempt;
    bool applied;
    ErrorCode code;
    std::string message;
};

// Everything one engine run knows about its files. Created per run and
// passed explicitly; nothing here outlives the run.
struct ExecutionState {
    explicit ExecutionState(int maxFixAttempts = 3);

    std::map<std::string, sandbox::ExecutionResult> results;
    // Only files whose latest result failed.
    std::map<std::string, std::vector<std::string>> errors;
    // Monotonic within a run.
    std::map<std::string, int> fixAttempts;
    int maxFixAttempts;

    std::map<std::string, FileStatus> status;
    std::vector<AttemptRecord> history;
    std::vector<RepairRecord> repairs;
    int cycles = 0;
    Error fatal;
    bool cancelled = false;

    bool needsRevision() const;
    bool hasFatal() const { return !fatal.ok(); }

    FileStatus statusOf(const std::string& path) const;
    int attemptsOf(const std::string& path) const;
    bool isTerminal(const std::string& path) const;

    // Stores the latest result and moves the file along its state machine.
    void recordResult(const std::string& path, const sandbox::ExecutionResult& result);
    // Consumes one attempt; the file stays in `errors` until it passes.
    void recordRepair(const std::string& path, bool applied, ErrorCode code, const std::string& message);
    void markPending(const std::string& path);

    size_t successCount() const;
    std::vector<std::string> failedFiles() const;
};

ErrorCode classifyFailure(const sandbox::ExecutionResult& result);

// Throws EngineError(INVALID_FILE_SET) for an empty, absolute or
// parent-escaping path.
void validateFileSet(const FileSet& files);
bool isValidFilePath(const std::string& path);

}
}
