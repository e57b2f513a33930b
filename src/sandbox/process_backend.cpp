#include "sandbox/sandbox.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <cmath>
#include <cstdlib>

namespace codemend {
namespace sandbox {

ProcessSandboxBackend::ProcessSandboxBackend(const SandboxConfig& config) : config_(config) {}

bool ProcessSandboxBackend::checkAvailable() {
    reason_.clear();
    if (!ProcessRunner::isExecutable(config_.shell)) {
        reason_ = "Shell not executable: " + config_.shell;
        return false;
    }
    if (config_.networkDisabled && !ProcessRunner::canIsolateNetwork()) {
        reason_ = "Network isolation requested but user/network namespaces are not permitted on this host";
        return false;
    }
    return true;
}

std::string ProcessSandboxBackend::buildScript(const RuntimeProfile& runtime,
                                               const std::string& entryPoint,
                                               bool hasManifest) {
    std::string run = runtime.interpreter + " " + utils::Formatter::shellQuote(entryPoint);
    if (hasManifest && !runtime.installCommand.empty()) {
        return runtime.installCommand + " && " + run;
    }
    return run;
}

ProcessOutcome ProcessSandboxBackend::run(const SandboxInvocation& invocation) {
    ProcessSpec spec;
    spec.argv = {config_.shell, "-c", buildScript(config_.runtime, invocation.entryPoint, invocation.hasManifest)};
    spec.workingDir = invocation.workspaceDir;
    spec.inheritEnvironment = false;

    const char* hostPath = std::getenv("PATH");
    spec.env["PATH"] = hostPath ? hostPath : "/usr/local/bin:/usr/bin:/bin";
    spec.env["HOME"] = invocation.workspaceDir;
    spec.env["TMPDIR"] = invocation.workspaceDir;
    spec.env["LANG"] = "C.UTF-8";
    spec.env["PYTHONDONTWRITEBYTECODE"] = "1";
    spec.env["PYTHONUNBUFFERED"] = "1";
    for (const auto& [key, value] : invocation.env) {
        spec.env[key] = value;
    }

    spec.timeout = std::chrono::milliseconds(config_.timeoutMs);
    spec.limits.memoryBytes = config_.memoryLimit;
    double cpuSeconds = std::ceil(static_cast<double>(config_.timeoutMs) / 1000.0 * config_.cpuLimit);
    spec.limits.cpuSeconds = cpuSeconds < 1.0 ? 1 : static_cast<uint64_t>(cpuSeconds);
    spec.limits.maxOpenFiles = config_.maxOpenFiles;
    spec.isolateNetwork = config_.networkDisabled;

    LOG_DEBUG("process backend: " + spec.argv[2] + " in " + invocation.workspaceDir);
    return ProcessRunner::run(spec);
}

}
}
