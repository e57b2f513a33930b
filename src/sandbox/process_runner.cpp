#include "sandbox/process_runner.h"
#include "utils/utils.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace codemend {
namespace sandbox {

namespace {

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

struct Pipe {
    FdGuard readEnd;
    FdGuard writeEnd;

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) < 0) return false;
        readEnd.reset(fds[0]);
        writeEnd.reset(fds[1]);
        return true;
    }
};

void ignoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void childFail(int code, const char* what) {
    static const char prefix[] = "SandboxError: ";
    ssize_t ignored = ::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
    ignored = ::write(STDERR_FILENO, what, std::strlen(what));
    ignored = ::write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    ::_exit(code);
}

void applyLimit(int resource, uint64_t value) {
    if (value == 0) return;
    struct rlimit rl;
    rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(value);
    ::setrlimit(resource, &rl);
}

// Returns false once the descriptor reached EOF or failed.
bool drainInto(FdGuard& fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            fd.reset();
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        fd.reset();
        return false;
    }
}

std::vector<std::string> buildEnvironment(const ProcessSpec& spec) {
    std::vector<std::string> env;
    if (spec.inheritEnvironment && environ) {
        for (char** e = environ; *e; ++e) {
            std::string entry(*e);
            auto eq = entry.find('=');
            std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
            if (spec.env.count(key)) continue;
            env.push_back(entry);
        }
    }
    for (const auto& [key, value] : spec.env) {
        env.push_back(key + "=" + value);
    }
    return env;
}

}

ProcessOutcome ProcessRunner::run(const ProcessSpec& spec) {
    ProcessOutcome outcome;
    if (spec.argv.empty()) {
        outcome.error = "Empty command";
        return outcome;
    }

    ignoreSigpipeOnce();

    std::vector<std::string> envStrings = buildEnvironment(spec);
    std::vector<char*> argvPtrs;
    for (const auto& a : spec.argv) argvPtrs.push_back(const_cast<char*>(a.c_str()));
    argvPtrs.push_back(nullptr);
    std::vector<char*> envPtrs;
    for (const auto& e : envStrings) envPtrs.push_back(const_cast<char*>(e.c_str()));
    envPtrs.push_back(nullptr);

    Pipe pipeIn, pipeOut, pipeErr;
    if (!pipeIn.open() || !pipeOut.open() || !pipeErr.open()) {
        outcome.error = "Failed to create pipes";
        return outcome;
    }

    auto startTime = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        outcome.error = "Failed to fork process";
        return outcome;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);

        ::dup2(pipeIn.readEnd.get(), STDIN_FILENO);
        ::dup2(pipeOut.writeEnd.get(), STDOUT_FILENO);
        ::dup2(pipeErr.writeEnd.get(), STDERR_FILENO);

        if (spec.isolateNetwork && ::unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
            childFail(kExitIsolationFailed, "network isolation unavailable");
        }

        applyLimit(RLIMIT_AS, spec.limits.memoryBytes);
        applyLimit(RLIMIT_CPU, spec.limits.cpuSeconds);
        applyLimit(RLIMIT_NOFILE, spec.limits.maxOpenFiles);

        if (!spec.workingDir.empty() && ::chdir(spec.workingDir.c_str()) != 0) {
            childFail(kExitExecFailed, "cannot enter working directory");
        }

        ::execvpe(argvPtrs[0], argvPtrs.data(), envPtrs.data());
        childFail(kExitExecFailed, "exec failed");
    }

    ::setpgid(pid, pid);
    outcome.started = true;

    pipeIn.readEnd.reset();
    pipeOut.writeEnd.reset();
    pipeErr.writeEnd.reset();

    setNonBlocking(pipeOut.readEnd.get());
    setNonBlocking(pipeErr.readEnd.get());
    setNonBlocking(pipeIn.writeEnd.get());

    size_t stdinOffset = 0;
    if (spec.stdinData.empty()) pipeIn.writeEnd.reset();

    auto deadline = startTime + spec.timeout;
    int status = 0;
    bool exited = false;

    while (!exited) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            ::killpg(pid, SIGKILL);
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            outcome.timedOut = true;
            break;
        }

        pollfd fds[3];
        nfds_t count = 0;
        if (pipeOut.readEnd.valid()) fds[count++] = {pipeOut.readEnd.get(), POLLIN, 0};
        if (pipeErr.readEnd.valid()) fds[count++] = {pipeErr.readEnd.get(), POLLIN, 0};
        if (pipeIn.writeEnd.valid()) fds[count++] = {pipeIn.writeEnd.get(), POLLOUT, 0};

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int waitMs = static_cast<int>(std::max<int64_t>(1, std::min<int64_t>(20, remaining)));
        ::poll(fds, count, waitMs);

        if (pipeOut.readEnd.valid()) drainInto(pipeOut.readEnd, outcome.stdoutText);
        if (pipeErr.readEnd.valid()) drainInto(pipeErr.readEnd, outcome.stderrText);

        if (pipeIn.writeEnd.valid()) {
            ssize_t n = ::write(pipeIn.writeEnd.get(),
                                spec.stdinData.data() + stdinOffset,
                                spec.stdinData.size() - stdinOffset);
            if (n > 0) {
                stdinOffset += static_cast<size_t>(n);
                if (stdinOffset >= spec.stdinData.size()) pipeIn.writeEnd.reset();
            } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                pipeIn.writeEnd.reset();
            }
        }

        int waitResult = ::waitpid(pid, &status, WNOHANG);
        if (waitResult == pid) {
            exited = true;
        } else if (waitResult < 0 && errno != EINTR) {
            exited = true;
            outcome.error = "waitpid failed";
        }
    }

    // Anything the entry point left behind in its group goes too.
    ::killpg(pid, SIGKILL);
    pipeIn.writeEnd.reset();

    auto drainDeadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
    while ((pipeOut.readEnd.valid() || pipeErr.readEnd.valid()) &&
           std::chrono::steady_clock::now() < drainDeadline) {
        pollfd fds[2];
        nfds_t count = 0;
        if (pipeOut.readEnd.valid()) fds[count++] = {pipeOut.readEnd.get(), POLLIN, 0};
        if (pipeErr.readEnd.valid()) fds[count++] = {pipeErr.readEnd.get(), POLLIN, 0};
        ::poll(fds, count, 20);
        if (pipeOut.readEnd.valid()) drainInto(pipeOut.readEnd, outcome.stdoutText);
        if (pipeErr.readEnd.valid()) drainInto(pipeErr.readEnd, outcome.stderrText);
    }

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);

    if (outcome.timedOut) {
        outcome.exitCode = -1;
        if (spec.onTimeout) spec.onTimeout();
    } else if (WIFEXITED(status)) {
        outcome.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.termSignal = WTERMSIG(status);
        outcome.exitCode = 128 + outcome.termSignal;
    }

    return outcome;
}

bool ProcessRunner::isExecutable(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('/') != std::string::npos) {
        return ::access(path.c_str(), X_OK) == 0;
    }
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return false;
    for (const auto& dir : utils::Formatter::split(pathEnv, ':')) {
        std::string candidate = (dir.empty() ? "." : dir) + "/" + path;
        if (::access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

bool ProcessRunner::commandSucceeds(const std::vector<std::string>& argv,
                                    std::chrono::milliseconds timeout) {
    if (argv.empty() || !isExecutable(argv[0])) return false;
    ProcessSpec spec;
    spec.argv = argv;
    spec.timeout = timeout;
    ProcessOutcome outcome = run(spec);
    return outcome.started && !outcome.timedOut && outcome.exitCode == 0;
}

bool ProcessRunner::canIsolateNetwork() {
    pid_t pid = ::fork();
    if (pid < 0) return false;
    if (pid == 0) {
        ::_exit(::unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0 ? 0 : 1);
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}
}
