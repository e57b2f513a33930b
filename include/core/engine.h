#pragma once

#include "core/dependencies.h"
#include "core/entry_points.h"
#include "core/execution_state.h"
#include "core/options.h"
#include "core/self_healing.h"
#include "sandbox/sandbox.h"
#include "utils/threading.h"
#include <string>
#include <vector>

namespace codemend {
namespace core {

struct HealingOutcome {
    FileSet files;
    ExecutionState state;

    // No fatal error, not cancelled and no file left failing.
    bool succeeded() const;
    std::vector<std::string> failedFiles() const { return state.failedFiles(); }
};

// Execute, repair, re-execute until every file passes or runs out of
// attempts. The sandbox limits come from the runner's SandboxConfig.
class HealingEngine {
public:
    HealingEngine(sandbox::SandboxRunner& runner, RepairCapability& capability);

    EntryPointResolver& entryPoints() { return entryPoints_; }
    DependencyResolver& dependencies() { return dependencies_; }

    // Throws EngineError for an invalid file set or maxFixAttempts < 1.
    HealingOutcome runAndHeal(const FileSet& files,
                              const TechStack& techStack,
                              const EngineOptions& options = EngineOptions(),
                              const utils::CancellationToken* cancel = nullptr);

private:
    sandbox::SandboxRunner& runner_;
    RepairCapability& capability_;
    EntryPointResolver entryPoints_;
    DependencyResolver dependencies_;
};

}
}
