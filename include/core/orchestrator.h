#pragma once

#include "core/dependencies.h"
#include "core/entry_points.h"
#include "core/execution_state.h"
#include "sandbox/sandbox.h"
#include "utils/threading.h"
#include <map>
#include <string>

namespace codemend {
namespace core {

// One execution pass over a file set. The state is only ever mutated from
// the calling thread, in lexical path order, whatever the worker count.
class ExecutionOrchestrator {
public:
    ExecutionOrchestrator(sandbox::SandboxRunner& runner,
                          const EntryPointResolver& entryPoints,
                          const DependencyResolver& dependencies);

    void setWorkerThreads(size_t count);
    size_t workerThreads() const { return workerThreads_; }
    void setEnvironment(const std::map<std::string, std::string>& env);

    // Files already DONE or EXHAUSTED are not re-run after the first pass.
    void run(const FileSet& files,
             const TechStack& techStack,
             bool executionEnabled,
             ExecutionState& state,
             const utils::CancellationToken* cancel = nullptr);

private:
    sandbox::SandboxJob makeJob(const FileSet& files, const std::string& entryPoint,
                                const std::vector<std::string>& dependencies) const;
    void runSequential(const FileSet& files, const std::vector<std::string>& entries,
                       const std::vector<std::string>& dependencies, ExecutionState& state,
                       const utils::CancellationToken* cancel);
    void runParallel(const FileSet& files, const std::vector<std::string>& entries,
                     const std::vector<std::string>& dependencies, ExecutionState& state,
                     const utils::CancellationToken* cancel);
    void logSummary(const std::vector<std::string>& entries, const ExecutionState& state) const;

    sandbox::SandboxRunner& runner_;
    const EntryPointResolver& entryPoints_;
    const DependencyResolver& dependencies_;
    size_t workerThreads_ = 1;
    std::map<std::string, std::string> env_;
};

}
}
