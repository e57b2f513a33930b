#pragma once

#include "sandbox/sandbox.h"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace codemend {
namespace test {

// Backend that never spawns anything. The entry file is read back from the
// materialized workspace and handed to `script`; the default script fails
// on "FAIL" / "MISSING" markers and succeeds otherwise.
class FakeBackend : public sandbox::SandboxBackend {
public:
    using Script = std::function<sandbox::ProcessOutcome(const sandbox::SandboxInvocation&, const std::string&)>;

    explicit FakeBackend(bool available = true) : available_(available) {}

    std::string name() const override { return "fake"; }
    bool checkAvailable() override { return available_; }
    std::string unavailableReason() const override { return available_ ? "" : "fake backend disabled"; }

    sandbox::ProcessOutcome run(const sandbox::SandboxInvocation& invocation) override {
        calls++;
        std::ifstream in(std::filesystem::path(invocation.workspaceDir) / invocation.entryPoint);
        std::stringstream ss;
        ss << in.rdbuf();
        {
            std::lock_guard<std::mutex> lock(mtx);
            invoked.push_back(invocation.entryPoint);
            if (invocation.hasManifest) manifests.insert(invocation.entryPoint);
        }
        return script ? script(invocation, ss.str()) : defaultScript(ss.str());
    }

    static sandbox::ProcessOutcome defaultScript(const std::string& content) {
        sandbox::ProcessOutcome out;
        out.started = true;
        out.duration = std::chrono::milliseconds(1);
        if (content.find("MISSING") != std::string::npos) {
            out.exitCode = 1;
            out.stderrText = "Traceback (most recent call last):\n"
                             "ModuleNotFoundError: No module named 'requests'\n";
        } else if (content.find("FAIL") != std::string::npos) {
            out.exitCode = 1;
            out.stderrText = "RuntimeError: boom\n";
        } else {
            out.exitCode = 0;
            out.stdoutText = "ok\n";
        }
        return out;
    }

    std::vector<std::string> invokedPaths() {
        std::lock_guard<std::mutex> lock(mtx);
        return invoked;
    }

    std::atomic<int> calls{0};
    Script script;
    std::mutex mtx;
    std::vector<std::string> invoked;
    std::set<std::string> manifests;

private:
    bool available_;
};

// Returns the runner plus a raw pointer to the backend it owns.
inline std::unique_ptr<sandbox::SandboxRunner> makeFakeRunner(FakeBackend*& backendOut, bool available = true,
                                                              const sandbox::SandboxConfig& config = sandbox::SandboxConfig()) {
    auto backend = std::make_unique<FakeBackend>(available);
    backendOut = backend.get();
    return std::make_unique<sandbox::SandboxRunner>(config, std::move(backend));
}

inline sandbox::SandboxConfig shellConfig() {
    sandbox::SandboxConfig config;
    config.backend = sandbox::BackendKind::PROCESS;
    config.shell = "/bin/sh";
    config.timeoutMs = 10000;
    config.runtime = sandbox::RuntimeProfile::shell();
    return config;
}

}
}
