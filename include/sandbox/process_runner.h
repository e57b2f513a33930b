#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace codemend {
namespace sandbox {

struct ResourceLimits {
    uint64_t memoryBytes = 0;   // RLIMIT_AS, 0 = unlimited
    uint64_t cpuSeconds = 0;    // RLIMIT_CPU, 0 = unlimited
    uint32_t maxOpenFiles = 0;  // RLIMIT_NOFILE, 0 = inherited
};

struct ProcessSpec {
    std::vector<std::string> argv;
    std::string workingDir;
    std::map<std::string, std::string> env;
    bool inheritEnvironment = true;
    std::string stdinData;
    std::chrono::milliseconds timeout{30000};
    ResourceLimits limits;
    bool isolateNetwork = false;
    // Invoked after the process group was killed on timeout.
    std::function<void()> onTimeout;
};

struct ProcessOutcome {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    int termSignal = 0;
    std::string stdoutText;
    std::string stderrText;
    std::chrono::milliseconds duration{0};
    std::string error;
};

// Child exit codes reserved for failures between fork and exec.
constexpr int kExitIsolationFailed = 125;
constexpr int kExitExecFailed = 127;

// fork/exec with piped stdio, a private process group, rlimits and a wall
// clock deadline. The whole group is SIGKILLed on timeout and again after
// the leader exits so no stray children survive a run.
class ProcessRunner {
public:
    static ProcessOutcome run(const ProcessSpec& spec);

    static bool isExecutable(const std::string& path);
    static bool commandSucceeds(const std::vector<std::string>& argv,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
    // Tries unshare(CLONE_NEWUSER | CLONE_NEWNET) in a throwaway child.
    static bool canIsolateNetwork();
};

}
}
