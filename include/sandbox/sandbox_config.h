#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace codemend {
namespace sandbox {

enum class BackendKind {
    PROCESS,
    DOCKER
};

const char* backendKindName(BackendKind kind);
BackendKind parseBackendKind(const std::string& name, BackendKind def = BackendKind::PROCESS);

// How source files of the target language are recognized, installed and run.
struct RuntimeProfile {
    std::string interpreter = "python3";
    std::string sourceExtension = ".py";
    std::string manifestName = "requirements.txt";
    std::string installCommand = "pip install -q -r requirements.txt";
    std::vector<std::string> mainNames = {"main.py", "app.py", "run.py", "__main__.py"};

    static RuntimeProfile python();
    static RuntimeProfile shell();
};

struct SandboxConfig {
    BackendKind backend = BackendKind::PROCESS;
    uint32_t timeoutMs = 30000;
    uint64_t memoryLimit = 512ULL * 1024 * 1024;
    double cpuLimit = 1.0;
    uint32_t maxOpenFiles = 256;
    bool networkDisabled = false;
    std::string image = "python:3.11-slim";
    std::string shell = "/bin/sh";
    std::string dockerBinary = "docker";
    // Parent directory for per-run workspaces; empty means the system temp dir.
    std::string workRoot;
    RuntimeProfile runtime;
};

}
}
