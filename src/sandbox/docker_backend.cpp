#include "sandbox/sandbox.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <atomic>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace codemend {
namespace sandbox {

namespace {

std::string nextContainerName() {
    static std::atomic<uint64_t> counter{0};
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return "codemend-" + std::to_string(::getpid()) + "-" +
           std::to_string(counter++) + "-" + std::to_string(ticks % 1000000);
}

std::string formatCpus(double cpus) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << cpus;
    return ss.str();
}

}

DockerSandboxBackend::DockerSandboxBackend(const SandboxConfig& config) : config_(config) {}

bool DockerSandboxBackend::checkAvailable() {
    reason_.clear();
    if (!ProcessRunner::commandSucceeds({config_.dockerBinary, "--version"})) {
        reason_ = "Docker not available on this system";
        return false;
    }
    return true;
}

std::vector<std::string> DockerSandboxBackend::buildCommand(const SandboxInvocation& invocation,
                                                            const std::string& containerName) const {
    uint64_t memoryMb = config_.memoryLimit / (1024 * 1024);
    if (memoryMb == 0) memoryMb = 1;

    std::vector<std::string> cmd = {
        config_.dockerBinary, "run", "--rm",
        "--name", containerName,
        "--memory=" + std::to_string(memoryMb) + "m",
        "--cpus=" + formatCpus(config_.cpuLimit),
        "-v", invocation.workspaceDir + ":/app",
        "-w", "/app"
    };
    if (config_.networkDisabled) {
        cmd.push_back("--network");
        cmd.push_back("none");
    }
    for (const auto& [key, value] : invocation.env) {
        cmd.push_back("-e");
        cmd.push_back(key + "=" + value);
    }
    cmd.push_back(config_.image);
    cmd.push_back("sh");
    cmd.push_back("-c");
    cmd.push_back(ProcessSandboxBackend::buildScript(config_.runtime, invocation.entryPoint, invocation.hasManifest));
    return cmd;
}

ProcessOutcome DockerSandboxBackend::run(const SandboxInvocation& invocation) {
    std::string containerName = nextContainerName();

    ProcessSpec spec;
    spec.argv = buildCommand(invocation, containerName);
    spec.timeout = std::chrono::milliseconds(config_.timeoutMs);
    std::string docker = config_.dockerBinary;
    spec.onTimeout = [docker, containerName]() {
        if (!ProcessRunner::commandSucceeds({docker, "rm", "-f", containerName},
                                            std::chrono::milliseconds(10000))) {
            LOG_WARN("Failed to remove timed out container " + containerName);
        }
    };

    LOG_DEBUG("docker backend: container " + containerName + " image " + config_.image);
    return ProcessRunner::run(spec);
}

}
}
