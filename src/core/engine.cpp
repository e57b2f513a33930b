#include "core/engine.h"
#include "core/orchestrator.h"
#include "utils/logger.h"

namespace codemend {
namespace core {

bool HealingOutcome::succeeded() const {
    return !state.hasFatal() && !state.cancelled && state.errors.empty();
}

HealingEngine::HealingEngine(sandbox::SandboxRunner& runner, RepairCapability& capability)
    : runner_(runner), capability_(capability), entryPoints_(runner.config().runtime) {}

HealingOutcome HealingEngine::runAndHeal(const FileSet& files,
                                         const TechStack& techStack,
                                         const EngineOptions& options,
                                         const utils::CancellationToken* cancel) {
    validateFileSet(files);
    HealingOutcome outcome{files, ExecutionState(options.maxFixAttempts)};

    ExecutionOrchestrator orchestrator(runner_, entryPoints_, dependencies_);
    orchestrator.setWorkerThreads(options.workerThreads);
    orchestrator.setEnvironment(options.env);

    SelfHealingLoop healer(capability_);

    orchestrator.run(outcome.files, techStack, options.executionEnabled, outcome.state, cancel);

    while (options.selfHealingEnabled && !outcome.state.cancelled && outcome.state.needsRevision()) {
        if (cancel && cancel->isCancelled()) {
            outcome.state.cancelled = true;
            break;
        }
        size_t consumed = healer.repair(outcome.files, outcome.state);
        if (consumed == 0) break;
        orchestrator.run(outcome.files, techStack, options.executionEnabled, outcome.state, cancel);
    }

    if (outcome.state.hasFatal()) {
        LOG_ERROR("Run aborted: " + outcome.state.fatal.message);
    } else if (outcome.succeeded()) {
        LOG_INFO("All files executed successfully after " + std::to_string(outcome.state.cycles) + " pass(es)");
    } else if (!outcome.state.errors.empty()) {
        LOG_WARN(std::to_string(outcome.state.errors.size()) + " file(s) still failing after " +
                 std::to_string(outcome.state.repairs.size()) + " repair attempt(s)");
    }
    return outcome;
}

}
}
