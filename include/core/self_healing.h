#pragma once

#include "core/execution_state.h"
#include <functional>
#include <string>
#include <vector>

namespace codemend {
namespace core {

struct RepairRequest {
    std::string path;
    std::string code;
    std::vector<std::string> errors;
    std::string stderrExcerpt;
    int attempt;
    int maxAttempts;
};

// Produces replacement source for a failing file. An empty reply means the
// capability could not help. Implementations may throw; the loop treats a
// thrown exception like an empty reply.
class RepairCapability {
public:
    virtual ~RepairCapability() = default;
    virtual std::string repair(const RepairRequest& request) = 0;
};

class FunctionRepairCapability : public RepairCapability {
public:
    using RepairFn = std::function<std::string(const RepairRequest&)>;

    explicit FunctionRepairCapability(RepairFn fn);
    std::string repair(const RepairRequest& request) override;

private:
    RepairFn fn_;
};

// Extracts the first fenced block (``` or ```lang) if there is one and
// trims surrounding whitespace.
std::string stripCodeFences(const std::string& text);

class SelfHealingLoop {
public:
    explicit SelfHealingLoop(RepairCapability& capability);

    // One pass over state.errors in path order. Files at the attempt cap are
    // skipped before the capability is asked. Returns the number of attempts
    // consumed.
    size_t repair(FileSet& files, ExecutionState& state);

    static constexpr size_t kStderrExcerptChars = 1000;

private:
    RepairCapability& capability_;
};

}
}
