#include "sandbox/sandbox.h"
#include "sandbox/workspace.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace codemend {
namespace sandbox {

const char* backendKindName(BackendKind kind) {
    switch (kind) {
        case BackendKind::PROCESS: return "process";
        case BackendKind::DOCKER: return "docker";
        default: return "unknown";
    }
}

BackendKind parseBackendKind(const std::string& name, BackendKind def) {
    std::string lower = utils::Formatter::toLower(utils::Formatter::trim(name));
    if (lower == "process") return BackendKind::PROCESS;
    if (lower == "docker") return BackendKind::DOCKER;
    return def;
}

RuntimeProfile RuntimeProfile::python() {
    return RuntimeProfile{};
}

RuntimeProfile RuntimeProfile::shell() {
    RuntimeProfile profile;
    profile.interpreter = "sh";
    profile.sourceExtension = ".sh";
    profile.manifestName = "packages.txt";
    profile.installCommand = "test -r packages.txt";
    profile.mainNames = {"main.sh", "run.sh"};
    return profile;
}

std::unique_ptr<SandboxBackend> makeBackend(const SandboxConfig& config) {
    if (config.backend == BackendKind::DOCKER) {
        return std::make_unique<DockerSandboxBackend>(config);
    }
    return std::make_unique<ProcessSandboxBackend>(config);
}

struct SandboxRunner::Impl {
    SandboxConfig config;
    std::unique_ptr<SandboxBackend> backend;
    ErrorClassifier classifier;
    mutable std::mutex classifierMtx;
    bool available = false;
    std::string unavailableReason;

    std::atomic<uint64_t> executionCount{0};
    std::atomic<uint64_t> successfulExecutions{0};
    std::atomic<uint64_t> failedExecutions{0};
    std::atomic<uint64_t> timeouts{0};
    std::atomic<uint64_t> unavailableRejections{0};
    std::atomic<uint64_t> totalExecutionTimeMs{0};

    ExecutionResult toResult(const ProcessOutcome& outcome, const std::string& entryPoint);
    void record(const ExecutionResult& result);
};

ExecutionResult SandboxRunner::Impl::toResult(const ProcessOutcome& outcome, const std::string& entryPoint) {
    if (!outcome.started) {
        std::string reason = outcome.error.empty() ? "unknown failure" : outcome.error;
        LOG_ERROR("Sandbox could not start " + entryPoint + ": " + reason);
        return ExecutionResult::failure(ErrorCode::INTERNAL_ERROR, "Failed to start sandbox: " + reason,
                                        outcome.stdoutText, outcome.stderrText, outcome.duration);
    }

    if (outcome.timedOut) {
        timeouts++;
        std::string msg = "Execution timed out after " + std::to_string(config.timeoutMs) + " ms";
        LOG_WARN(entryPoint + ": " + msg);
        std::string stderrText = outcome.stderrText;
        if (!stderrText.empty() && stderrText.back() != '\n') stderrText += "\n";
        stderrText += msg;
        return ExecutionResult::failure(ErrorCode::TIMEOUT,
                                        "Timeout after " + std::to_string(config.timeoutMs) + "ms",
                                        outcome.stdoutText, stderrText, outcome.duration);
    }

    Classification classified;
    {
        std::lock_guard<std::mutex> lock(classifierMtx);
        classified = classifier.classify(outcome.stderrText);
    }

    if (outcome.termSignal != 0) {
        LOG_WARN(entryPoint + ": terminated by signal " + std::to_string(outcome.termSignal));
    }

    ExecutionResult result(outcome.exitCode, outcome.stdoutText, outcome.stderrText, outcome.duration,
                           std::move(classified.errors), std::move(classified.warnings));
    LOG_INFO("Execution completed: " + entryPoint +
             " exit_code=" + std::to_string(result.exitCode()) +
             " time=" + utils::Formatter::formatDurationMs(static_cast<uint64_t>(result.duration().count())) +
             " errors=" + std::to_string(result.errors().size()));
    return result;
}

void SandboxRunner::Impl::record(const ExecutionResult& result) {
    if (result.success()) {
        successfulExecutions++;
    } else {
        failedExecutions++;
    }
    totalExecutionTimeMs += static_cast<uint64_t>(result.duration().count());
}

SandboxRunner::SandboxRunner(const SandboxConfig& config)
    : SandboxRunner(config, makeBackend(config)) {}

SandboxRunner::SandboxRunner(const SandboxConfig& config, std::unique_ptr<SandboxBackend> backend)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->backend = std::move(backend);
    if (!impl_->backend) {
        impl_->unavailableReason = "No sandbox backend configured";
    } else if (impl_->backend->checkAvailable()) {
        impl_->available = true;
        LOG_INFO("Sandbox runner initialized with " + impl_->backend->name() + " backend" +
                 " (timeout=" + std::to_string(config.timeoutMs) + "ms" +
                 ", memory=" + utils::Formatter::formatBytes(config.memoryLimit) +
                 ", network=" + (config.networkDisabled ? "disabled" : "enabled") + ")");
    } else {
        impl_->unavailableReason = impl_->backend->unavailableReason();
        LOG_WARN("Sandbox backend " + impl_->backend->name() + " not available - execution features will be disabled: " +
                 impl_->unavailableReason);
    }
}

SandboxRunner::~SandboxRunner() = default;

bool SandboxRunner::isAvailable() const { return impl_->available; }
std::string SandboxRunner::unavailableReason() const { return impl_->unavailableReason; }
std::string SandboxRunner::backendName() const { return impl_->backend ? impl_->backend->name() : "none"; }
const SandboxConfig& SandboxRunner::config() const { return impl_->config; }
ErrorClassifier SandboxRunner::classifier() const {
    std::lock_guard<std::mutex> lock(impl_->classifierMtx);
    return impl_->classifier;
}

void SandboxRunner::setClassifier(const ErrorClassifier& classifier) {
    std::lock_guard<std::mutex> lock(impl_->classifierMtx);
    impl_->classifier = classifier;
}

ExecutionResult SandboxRunner::execute(const SandboxJob& job) {
    if (job.entryPoint.empty() || job.files.find(job.entryPoint) == job.files.end()) {
        throw std::invalid_argument("Entry point not present in job files: " + job.entryPoint);
    }
    for (const auto& [path, content] : job.files) {
        if (!Workspace::isSafeRelativePath(path)) {
            throw std::invalid_argument("Unsafe file path in job: " + path);
        }
    }

    impl_->executionCount++;

    if (!impl_->available) {
        impl_->unavailableRejections++;
        impl_->failedExecutions++;
        return ExecutionResult::failure(ErrorCode::SANDBOX_UNAVAILABLE,
                                        "Sandbox unavailable: " + impl_->unavailableReason,
                                        "", impl_->unavailableReason, std::chrono::milliseconds(0));
    }

    const RuntimeProfile& runtime = impl_->config.runtime;
    auto start = std::chrono::steady_clock::now();
    ExecutionResult result;
    try {
        Workspace workspace(impl_->config.workRoot);
        for (const auto& [path, content] : job.files) {
            workspace.write(path, content);
        }

        bool hasManifest = job.files.count(runtime.manifestName) > 0;
        if (!job.dependencies.empty()) {
            std::string manifest;
            auto existing = job.files.find(runtime.manifestName);
            if (existing != job.files.end()) {
                manifest = existing->second;
                if (!manifest.empty() && manifest.back() != '\n') manifest += "\n";
            }
            manifest += utils::Formatter::join(job.dependencies, "\n") + "\n";
            workspace.write(runtime.manifestName, manifest);
            hasManifest = true;
        }

        SandboxInvocation invocation;
        invocation.workspaceDir = workspace.root().string();
        invocation.entryPoint = job.entryPoint;
        invocation.hasManifest = hasManifest;
        invocation.env = job.env;

        LOG_INFO("Executing " + job.entryPoint + " (" + std::to_string(job.files.size()) + " files, " +
                 std::to_string(job.dependencies.size()) + " dependencies) via " + impl_->backend->name());
        for (const auto& [key, value] : job.env) {
            LOG_DEBUG("  env " + key + "=" + utils::Logger::redactSensitive(key, value));
        }

        ProcessOutcome outcome = impl_->backend->run(invocation);
        result = impl_->toResult(outcome, job.entryPoint);
    } catch (const std::exception& e) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        LOG_ERROR("Execution failed for " + job.entryPoint + ": " + e.what());
        result = ExecutionResult::failure(ErrorCode::INTERNAL_ERROR, e.what(), "", e.what(), elapsed);
    }

    impl_->record(result);
    return result;
}

ExecutionResult SandboxRunner::executeCode(const std::string& code,
                                           const std::string& filename,
                                           const std::vector<std::string>& dependencies,
                                           const std::map<std::string, std::string>& env) {
    SandboxJob job;
    job.files[filename] = code;
    job.entryPoint = filename;
    job.dependencies = dependencies;
    job.env = env;
    return execute(job);
}

ExecutionResult SandboxRunner::executeFile(const std::string& hostPath,
                                           const std::vector<std::string>& dependencies,
                                           const std::map<std::string, std::string>& env) {
    std::ifstream file(hostPath, std::ios::binary);
    if (!file.is_open()) {
        impl_->executionCount++;
        impl_->failedExecutions++;
        return ExecutionResult::failure(ErrorCode::IO_ERROR, "Could not open file: " + hostPath,
                                        "", "Could not open file: " + hostPath, std::chrono::milliseconds(0));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string filename = std::filesystem::path(hostPath).filename().string();
    return executeCode(buffer.str(), filename, dependencies, env);
}

SandboxStats SandboxRunner::getStats() const {
    SandboxStats stats{};
    stats.totalExecutions = impl_->executionCount;
    stats.successfulExecutions = impl_->successfulExecutions;
    stats.failedExecutions = impl_->failedExecutions;
    stats.timeouts = impl_->timeouts;
    stats.unavailableRejections = impl_->unavailableRejections;
    stats.totalExecutionTimeMs = impl_->totalExecutionTimeMs;
    return stats;
}

void SandboxRunner::resetStats() {
    impl_->executionCount = 0;
    impl_->successfulExecutions = 0;
    impl_->failedExecutions = 0;
    impl_->timeouts = 0;
    impl_->unavailableRejections = 0;
    impl_->totalExecutionTimeMs = 0;
}

}
}
