#include "core/command_repair.h"
#include "core/engine.h"
#include "core/report.h"
#include "infrastructure/error_handling.h"
#include "sandbox/sandbox.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/threading.h"
#include "utils/utils.h"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <getopt.h>

namespace codemend {

constexpr int kExitSuccess = 0;
constexpr int kExitFilesFailed = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    bool showHelp = false;
    bool showVersion = false;
    std::string dir;
    std::string manifest;
    std::string configPath;
    std::vector<std::string> stackSpecs;
    std::string maxAttempts;
    std::string timeoutMs;
    std::string memoryMb;
    bool noNetwork = false;
    std::string backend;
    bool noExec = false;
    bool noHeal = false;
    std::string repairCmd;
    std::string workers;
    std::string reportPath;
    bool writeBack = false;
    std::string logLevel;
    bool printConfig = false;
};

static utils::CancellationToken g_cancel;

static void signalHandler(int) {
    g_cancel.cancel();
}

static void registerSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printHelp(const char* progName) {
    std::cout << "codemend v0.1.0 - Sandboxed execution and self-healing retry engine\n\n";
    std::cout << "Usage: " << progName << " [options] (--dir DIR | --manifest FILE)\n\n";
    std::cout << "Input:\n";
    std::cout << "  --dir DIR           Execute the files under DIR\n";
    std::cout << "  --manifest FILE     JSON manifest {\"files\": {...}, \"tech_stack\": {...}}\n";
    std::cout << "  --stack ROLE=A,B    Declare frameworks for a stack role (repeatable)\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -v, --version       Show version\n";
    std::cout << "  -c, --config FILE   Use custom config file\n";
    std::cout << "  --max-attempts N    Repair attempts per file (default: 3)\n";
    std::cout << "  --timeout MS        Wall clock limit per run (default: 30000)\n";
    std::cout << "  --memory MB         Memory ceiling per run (default: 512)\n";
    std::cout << "  --no-network        Deny network access inside the sandbox\n";
    std::cout << "  --backend NAME      Sandbox backend: process|docker (default: process)\n";
    std::cout << "  --no-exec           Skip execution entirely\n";
    std::cout << "  --no-heal           Execute once, never repair\n";
    std::cout << "  --repair-cmd CMD    Command producing corrected code (JSON request on stdin)\n";
    std::cout << "  --workers N         Concurrent sandboxes (default: 1)\n";
    std::cout << "  --report FILE       Write a JSON report of the run\n";
    std::cout << "  --write-back        Write repaired files back into --dir\n";
    std::cout << "  --loglevel LEVEL    Log level (debug/info/warn/error)\n";
    std::cout << "  --print-config      Print the effective configuration as JSON and exit\n";
    std::cout << "\nExit status: 0 all files passed, 1 some file failed, 2 usage or fatal error\n";
}

void printVersion() {
    std::cout << "codemend v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    enum LongOnly {
        OPT_DIR = 1000,
        OPT_MANIFEST,
        OPT_STACK,
        OPT_MAX_ATTEMPTS,
        OPT_TIMEOUT,
        OPT_MEMORY,
        OPT_NO_NETWORK,
        OPT_BACKEND,
        OPT_NO_EXEC,
        OPT_NO_HEAL,
        OPT_REPAIR_CMD,
        OPT_WORKERS,
        OPT_REPORT,
        OPT_WRITE_BACK,
        OPT_LOGLEVEL,
        OPT_PRINT_CONFIG
    };

    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"dir", required_argument, nullptr, OPT_DIR},
        {"manifest", required_argument, nullptr, OPT_MANIFEST},
        {"stack", required_argument, nullptr, OPT_STACK},
        {"max-attempts", required_argument, nullptr, OPT_MAX_ATTEMPTS},
        {"timeout", required_argument, nullptr, OPT_TIMEOUT},
        {"memory", required_argument, nullptr, OPT_MEMORY},
        {"no-network", no_argument, nullptr, OPT_NO_NETWORK},
        {"backend", required_argument, nullptr, OPT_BACKEND},
        {"no-exec", no_argument, nullptr, OPT_NO_EXEC},
        {"no-heal", no_argument, nullptr, OPT_NO_HEAL},
        {"repair-cmd", required_argument, nullptr, OPT_REPAIR_CMD},
        {"workers", required_argument, nullptr, OPT_WORKERS},
        {"report", required_argument, nullptr, OPT_REPORT},
        {"write-back", no_argument, nullptr, OPT_WRITE_BACK},
        {"loglevel", required_argument, nullptr, OPT_LOGLEVEL},
        {"print-config", no_argument, nullptr, OPT_PRINT_CONFIG},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "hvc:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                opts.showHelp = true;
                return true;
            case 'v':
                opts.showVersion = true;
                return true;
            case 'c':
                opts.configPath = optarg;
                break;
            case OPT_DIR:
                opts.dir = optarg;
                break;
            case OPT_MANIFEST:
                opts.manifest = optarg;
                break;
            case OPT_STACK:
                opts.stackSpecs.push_back(optarg);
                break;
            case OPT_MAX_ATTEMPTS:
                opts.maxAttempts = optarg;
                break;
            case OPT_TIMEOUT:
                opts.timeoutMs = optarg;
                break;
            case OPT_MEMORY:
                opts.memoryMb = optarg;
                break;
            case OPT_NO_NETWORK:
                opts.noNetwork = true;
                break;
            case OPT_BACKEND:
                opts.backend = optarg;
                break;
            case OPT_NO_EXEC:
                opts.noExec = true;
                break;
            case OPT_NO_HEAL:
                opts.noHeal = true;
                break;
            case OPT_REPAIR_CMD:
                opts.repairCmd = optarg;
                break;
            case OPT_WORKERS:
                opts.workers = optarg;
                break;
            case OPT_REPORT:
                opts.reportPath = optarg;
                break;
            case OPT_WRITE_BACK:
                opts.writeBack = true;
                break;
            case OPT_LOGLEVEL:
                opts.logLevel = optarg;
                break;
            case OPT_PRINT_CONFIG:
                opts.printConfig = true;
                break;
            default:
                return false;
        }
    }

    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

static bool isPositiveNumber(const std::string& value) {
    if (value.empty() || value.size() > 9) return false;
    for (char c : value) {
        if (c < '0' || c > '9') return false;
    }
    return std::stol(value) > 0;
}

// CLI flags win over the config file and CODEMEND_* variables.
static bool applyOverrides(const CliOptions& opts, utils::Config& cfg) {
    struct NumericFlag { const char* flag; const std::string& value; const char* key; };
    const NumericFlag numeric[] = {
        {"--max-attempts", opts.maxAttempts, "engine.max_fix_attempts"},
        {"--timeout", opts.timeoutMs, "sandbox.timeout_ms"},
        {"--memory", opts.memoryMb, "sandbox.memory_limit_mb"},
        {"--workers", opts.workers, "engine.worker_threads"},
    };
    for (const auto& n : numeric) {
        if (n.value.empty()) continue;
        if (!isPositiveNumber(n.value)) {
            std::cerr << n.flag << " expects a positive integer, got '" << n.value << "'\n";
            return false;
        }
        cfg.set(n.key, n.value);
    }

    if (!opts.backend.empty()) {
        std::string backend = utils::Formatter::toLower(opts.backend);
        if (backend != "process" && backend != "docker") {
            std::cerr << "--backend expects process or docker, got '" << opts.backend << "'\n";
            return false;
        }
        cfg.set("sandbox.backend", backend);
    }
    if (opts.noNetwork) cfg.set("sandbox.network_disabled", true);
    if (opts.noExec) cfg.set("engine.execution_enabled", false);
    if (opts.noHeal) cfg.set("engine.self_healing_enabled", false);
    if (!opts.repairCmd.empty()) cfg.set("repair.command", opts.repairCmd);
    if (!opts.logLevel.empty()) cfg.set("log.level", opts.logLevel);
    return true;
}

static void setupLogging(const utils::Config& cfg) {
    utils::LogConfig logCfg = cfg.getLogConfig();
    utils::Logger::setLevel(utils::Logger::parseLevel(logCfg.level, utils::LogLevel::INFO));
    if (!logCfg.file.empty() && !utils::Logger::open(logCfg.file)) {
        std::cerr << "Warning: cannot open log file " << logCfg.file << "\n";
    }
}

static void printOutcome(const core::HealingOutcome& outcome) {
    const core::ExecutionState& state = outcome.state;
    if (state.hasFatal()) {
        std::cout << "FATAL " << errorCodeName(state.fatal.code) << ": " << state.fatal.message << "\n";
        return;
    }
    for (const auto& [path, result] : state.results) {
        std::cout << utils::Formatter::toUpper(core::fileStatusName(state.statusOf(path)))
                  << " " << path
                  << " exit=" << result.exitCode()
                  << " attempts=" << state.attemptsOf(path) << "/" << state.maxFixAttempts
                  << " time=" << utils::Formatter::formatDurationMs(static_cast<uint64_t>(result.duration().count()))
                  << "\n";
        if (!result.success()) {
            std::cout << "  " << result.errorSummary() << "\n";
        }
    }
    std::cout << state.successCount() << "/" << state.results.size() << " successful, "
              << state.errors.size() << " failed, " << state.cycles << " pass(es)"
              << (state.cancelled ? ", cancelled" : "") << "\n";
}

int run(const CliOptions& opts) {
    utils::Config& cfg = utils::Config::instance();
    if (!opts.configPath.empty() && !cfg.load(opts.configPath)) {
        std::cerr << "Cannot read config file " << opts.configPath << "\n";
        return kExitUsage;
    }
    cfg.loadEnvironment();
    if (!applyOverrides(opts, cfg)) {
        return kExitUsage;
    }
    if (opts.printConfig) {
        std::cout << cfg.toJson() << "\n";
        return kExitSuccess;
    }
    setupLogging(cfg);

    if (opts.dir.empty() == opts.manifest.empty()) {
        std::cerr << "Exactly one of --dir or --manifest is required\n";
        return kExitUsage;
    }

    Result<core::ProjectInput> loaded = opts.dir.empty() ? core::loadManifest(opts.manifest)
                                                         : core::loadDirectory(opts.dir);
    if (loaded.failed()) {
        std::cerr << loaded.error().describe() << "\n";
        return kExitUsage;
    }
    core::ProjectInput input = loaded.value();
    for (const auto& spec : opts.stackSpecs) {
        if (!core::parseStackSpec(spec, input.techStack)) {
            std::cerr << "--stack expects ROLE=NAME[,NAME...], got '" << spec << "'\n";
            return kExitUsage;
        }
    }
    if (input.files.empty()) {
        std::cerr << "No files to execute\n";
        return kExitUsage;
    }

    core::EngineOptions options = cfg.getEngineOptions();
    sandbox::SandboxRunner runner(cfg.getSandboxConfig());
    std::vector<std::string> errorSigs = cfg.getList("classifier.error_signatures");
    std::vector<std::string> warningSigs = cfg.getList("classifier.warning_signatures");
    if (!errorSigs.empty() || !warningSigs.empty()) {
        runner.setClassifier(sandbox::ErrorClassifier(
            errorSigs.empty() ? sandbox::ErrorClassifier::defaultErrorSignatures() : errorSigs,
            warningSigs.empty() ? sandbox::ErrorClassifier::defaultWarningSignatures() : warningSigs));
    }

    std::string repairCommand = cfg.getString("repair.command");
    std::unique_ptr<core::RepairCapability> capability;
    if (!repairCommand.empty()) {
        capability = std::make_unique<core::CommandRepairCapability>(
            repairCommand, std::chrono::milliseconds(cfg.getInt64("repair.timeout_ms", 120000)));
    } else {
        if (options.selfHealingEnabled) {
            LOG_INFO("No repair command configured, self-healing disabled");
        }
        options.selfHealingEnabled = false;
        capability = std::make_unique<core::FunctionRepairCapability>(nullptr);
    }

    core::HealingEngine engine(runner, *capability);
    size_t extra = engine.dependencies().loadFromConfig(cfg);
    if (extra > 0) {
        LOG_INFO("Loaded " + std::to_string(extra) + " dependency mapping(s) from config");
    }

    registerSignalHandlers();

    core::HealingOutcome outcome;
    try {
        outcome = engine.runAndHeal(input.files, input.techStack, options, &g_cancel);
    } catch (const EngineError& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }

    printOutcome(outcome);

    if (!opts.reportPath.empty()) {
        Result<void> written = core::writeReport(opts.reportPath, outcome);
        if (written.failed()) {
            LOG_ERROR(written.error().message);
        }
    }
    if (opts.writeBack) {
        if (opts.dir.empty()) {
            LOG_WARN("--write-back needs --dir, skipping");
        } else {
            Result<void> written = core::writeFiles(opts.dir, outcome.files);
            if (written.failed()) {
                LOG_ERROR(written.error().message);
            }
        }
    }

    utils::Logger::flush();
    if (outcome.state.hasFatal()) return kExitUsage;
    return outcome.succeeded() ? kExitSuccess : kExitFilesFailed;
}

}

int main(int argc, char* argv[]) {
    codemend::CliOptions opts;
    if (!codemend::parseArgs(argc, argv, opts)) {
        codemend::printHelp(argv[0]);
        return codemend::kExitUsage;
    }

    if (opts.showHelp) {
        codemend::printHelp(argv[0]);
        return 0;
    }

    if (opts.showVersion) {
        codemend::printVersion();
        return 0;
    }

    return codemend::run(opts);
}
