#include "core/orchestrator.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>
#include <future>
#include <optional>
#include <set>

namespace codemend {
namespace core {

namespace {

bool isCancelled(const utils::CancellationToken* cancel) {
    return cancel && cancel->isCancelled();
}

}

ExecutionOrchestrator::ExecutionOrchestrator(sandbox::SandboxRunner& runner,
                                             const EntryPointResolver& entryPoints,
                                             const DependencyResolver& dependencies)
    : runner_(runner), entryPoints_(entryPoints), dependencies_(dependencies) {}

void ExecutionOrchestrator::setWorkerThreads(size_t count) {
    workerThreads_ = std::max<size_t>(1, count);
}

void ExecutionOrchestrator::setEnvironment(const std::map<std::string, std::string>& env) {
    env_ = env;
}

sandbox::SandboxJob ExecutionOrchestrator::makeJob(const FileSet& files, const std::string& entryPoint,
                                                   const std::vector<std::string>& dependencies) const {
    sandbox::SandboxJob job;
    job.files = files;
    job.entryPoint = entryPoint;
    job.dependencies = dependencies;
    job.env = env_;
    return job;
}

void ExecutionOrchestrator::run(const FileSet& files,
                                const TechStack& techStack,
                                bool executionEnabled,
                                ExecutionState& state,
                                const utils::CancellationToken* cancel) {
    if (!executionEnabled) {
        LOG_INFO("Code execution disabled, skipping");
        return;
    }

    validateFileSet(files);

    if (!runner_.isAvailable()) {
        state.fatal = makeError(ErrorCode::SANDBOX_UNAVAILABLE,
                                "Sandbox not available: " + runner_.unavailableReason());
        LOG_ERROR(state.fatal.message);
        return;
    }

    std::set<std::string> selected;
    for (const auto& path : entryPoints_.resolve(files)) {
        if (state.cycles > 0 && state.isTerminal(path)) continue;
        selected.insert(path);
    }
    // A repaired file is re-run even when the new content no longer looks
    // like an entry point; its error clears only through re-execution.
    for (const auto& [path, errs] : state.errors) {
        if (state.statusOf(path) == FileStatus::REPAIRED && files.count(path) > 0) {
            selected.insert(path);
        }
    }
    std::vector<std::string> entries(selected.begin(), selected.end());

    std::set<std::string> resolved = dependencies_.resolve(techStack, "backend");
    std::vector<std::string> deps(resolved.begin(), resolved.end());

    state.cycles++;
    LOG_INFO("Execution pass " + std::to_string(state.cycles) + ": " +
             std::to_string(entries.size()) + " entry point(s)" +
             (deps.empty() ? "" : ", dependencies: " + utils::Formatter::join(deps, ", ")));

    for (const auto& path : entries) {
        state.markPending(path);
    }

    if (workerThreads_ > 1 && entries.size() > 1) {
        runParallel(files, entries, deps, state, cancel);
    } else {
        runSequential(files, entries, deps, state, cancel);
    }

    logSummary(entries, state);
}

void ExecutionOrchestrator::runSequential(const FileSet& files, const std::vector<std::string>& entries,
                                          const std::vector<std::string>& dependencies, ExecutionState& state,
                                          const utils::CancellationToken* cancel) {
    for (const auto& path : entries) {
        if (isCancelled(cancel)) {
            LOG_WARN("Execution cancelled before " + path);
            state.cancelled = true;
            return;
        }
        LOG_INFO("Executing: " + path);
        state.recordResult(path, runner_.execute(makeJob(files, path, dependencies)));
    }
}

void ExecutionOrchestrator::runParallel(const FileSet& files, const std::vector<std::string>& entries,
                                        const std::vector<std::string>& dependencies, ExecutionState& state,
                                        const utils::CancellationToken* cancel) {
    utils::ThreadPool pool(std::min(workerThreads_, entries.size()));
    LOG_DEBUG("Running " + std::to_string(entries.size()) + " sandbox(es) on " +
              std::to_string(pool.getThreadCount()) + " worker(s)");
    std::vector<std::future<std::optional<sandbox::ExecutionResult>>> pending;
    pending.reserve(entries.size());

    for (const auto& path : entries) {
        sandbox::SandboxJob job = makeJob(files, path, dependencies);
        pending.push_back(pool.enqueue([this, job, cancel]() -> std::optional<sandbox::ExecutionResult> {
            if (isCancelled(cancel)) return std::nullopt;
            LOG_INFO("Executing: " + job.entryPoint);
            return runner_.execute(job);
        }));
    }

    for (size_t i = 0; i < entries.size(); i++) {
        std::optional<sandbox::ExecutionResult> result = pending[i].get();
        if (!result) {
            LOG_WARN("Execution cancelled before " + entries[i]);
            state.cancelled = true;
            continue;
        }
        state.recordResult(entries[i], *result);
    }
}

void ExecutionOrchestrator::logSummary(const std::vector<std::string>& entries, const ExecutionState& state) const {
    size_t ran = 0;
    size_t ok = 0;
    std::vector<std::string> failed;
    for (const auto& path : entries) {
        auto it = state.results.find(path);
        if (it == state.results.end()) continue;
        if (state.statusOf(path) == FileStatus::PENDING) continue;
        ran++;
        if (it->second.success()) {
            ok++;
        } else {
            failed.push_back(path);
        }
    }
    LOG_INFO("Execution summary: " + std::to_string(ok) + "/" + std::to_string(ran) + " successful, " +
             std::to_string(failed.size()) + " failed");
    if (!failed.empty()) {
        LOG_WARN("Failed files: " + utils::Formatter::join(failed, ", "));
    }
}

}
}
