#pragma once

#include "sandbox/classifier.h"
#include "sandbox/execution_result.h"
#include "sandbox/process_runner.h"
#include "sandbox/sandbox_config.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace codemend {
namespace sandbox {

// Everything materialized for one run. `files` are written next to the entry
// point so it can import them; only `entryPoint` is invoked.
struct SandboxJob {
    std::map<std::string, std::string> files;
    std::string entryPoint;
    std::vector<std::string> dependencies;
    std::map<std::string, std::string> env;
};

// What a backend receives once the workspace has been populated.
struct SandboxInvocation {
    std::string workspaceDir;
    std::string entryPoint;
    bool hasManifest = false;
    std::map<std::string, std::string> env;
};

struct SandboxStats {
    uint64_t totalExecutions;
    uint64_t successfulExecutions;
    uint64_t failedExecutions;
    uint64_t timeouts;
    uint64_t unavailableRejections;
    uint64_t totalExecutionTimeMs;
};

// OS-level isolation facility. Implementations must be safe to call from
// several threads at once; every invocation is independent.
class SandboxBackend {
public:
    virtual ~SandboxBackend() = default;

    virtual std::string name() const = 0;
    // Called once by SandboxRunner at construction.
    virtual bool checkAvailable() = 0;
    virtual std::string unavailableReason() const = 0;
    virtual ProcessOutcome run(const SandboxInvocation& invocation) = 0;
};

// Direct fork/exec under rlimits, a private process group and, when asked,
// fresh user and network namespaces.
class ProcessSandboxBackend : public SandboxBackend {
public:
    explicit ProcessSandboxBackend(const SandboxConfig& config);

    std::string name() const override { return "process"; }
    bool checkAvailable() override;
    std::string unavailableReason() const override { return reason_; }
    ProcessOutcome run(const SandboxInvocation& invocation) override;

    // The `sh -c` script: optional install step, then the interpreter.
    static std::string buildScript(const RuntimeProfile& runtime, const std::string& entryPoint, bool hasManifest);

private:
    SandboxConfig config_;
    std::string reason_;
};

// `docker run --rm` with memory/cpu caps and the workspace bind-mounted at /app.
class DockerSandboxBackend : public SandboxBackend {
public:
    explicit DockerSandboxBackend(const SandboxConfig& config);

    std::string name() const override { return "docker"; }
    bool checkAvailable() override;
    std::string unavailableReason() const override { return reason_; }
    ProcessOutcome run(const SandboxInvocation& invocation) override;

    std::vector<std::string> buildCommand(const SandboxInvocation& invocation, const std::string& containerName) const;

private:
    SandboxConfig config_;
    std::string reason_;
};

std::unique_ptr<SandboxBackend> makeBackend(const SandboxConfig& config);

class SandboxRunner {
public:
    explicit SandboxRunner(const SandboxConfig& config);
    SandboxRunner(const SandboxConfig& config, std::unique_ptr<SandboxBackend> backend);
    ~SandboxRunner();

    SandboxRunner(const SandboxRunner&) = delete;
    SandboxRunner& operator=(const SandboxRunner&) = delete;

    bool isAvailable() const;
    std::string unavailableReason() const;
    std::string backendName() const;
    const SandboxConfig& config() const;
    // Snapshot of the classifier in use; setClassifier may run concurrently.
    ErrorClassifier classifier() const;
    void setClassifier(const ErrorClassifier& classifier);

    // Thread-safe. Failures of the run itself are returned, not thrown;
    // std::invalid_argument only for a job whose entry point is missing or
    // whose paths escape the workspace.
    ExecutionResult execute(const SandboxJob& job);
    ExecutionResult executeCode(const std::string& code,
                                const std::string& filename = "main.py",
                                const std::vector<std::string>& dependencies = {},
                                const std::map<std::string, std::string>& env = {});
    ExecutionResult executeFile(const std::string& hostPath,
                                const std::vector<std::string>& dependencies = {},
                                const std::map<std::string, std::string>& env = {});

    SandboxStats getStats() const;
    void resetStats();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
