#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace codemend {
namespace core {

// Per-run switches. Sandbox limits live in sandbox::SandboxConfig, owned by
// the SandboxRunner the engine is built around.
struct EngineOptions {
    bool executionEnabled = true;
    bool selfHealingEnabled = true;
    int maxFixAttempts = 3;
    size_t workerThreads = 1;
    // Extra environment for every sandboxed run.
    std::map<std::string, std::string> env;
};

}
}
