#include "core/command_repair.h"
#include "sandbox/process_runner.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace codemend {
namespace core {

CommandRepairCapability::CommandRepairCapability(std::string command,
                                                 std::chrono::milliseconds timeout,
                                                 std::string shell)
    : command_(std::move(command)), timeout_(timeout), shell_(std::move(shell)) {}

nlohmann::json CommandRepairCapability::encodeRequest(const RepairRequest& request) {
    nlohmann::json j;
    j["path"] = request.path;
    j["code"] = request.code;
    j["errors"] = request.errors;
    j["stderr"] = request.stderrExcerpt;
    j["attempt"] = request.attempt;
    j["max_attempts"] = request.maxAttempts;
    return j;
}

std::string CommandRepairCapability::decodeReply(const std::string& stdoutText) {
    std::string trimmed = utils::Formatter::trim(stdoutText);
    if (!trimmed.empty() && trimmed.front() == '{') {
        nlohmann::json parsed = nlohmann::json::parse(trimmed, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("code")) {
            const auto& code = parsed["code"];
            return code.is_string() ? code.get<std::string>() : std::string();
        }
    }
    return stdoutText;
}

std::string CommandRepairCapability::repair(const RepairRequest& request) {
    if (command_.empty()) return "";

    sandbox::ProcessSpec spec;
    spec.argv = {shell_, "-c", command_};
    spec.stdinData = encodeRequest(request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    spec.timeout = timeout_;

    sandbox::ProcessOutcome outcome = sandbox::ProcessRunner::run(spec);
    if (!outcome.started) {
        LOG_ERROR("Repair command could not start: " + outcome.error);
        return "";
    }
    if (outcome.timedOut) {
        LOG_WARN("Repair command timed out after " + std::to_string(timeout_.count()) + "ms for " + request.path);
        return "";
    }
    if (outcome.exitCode != 0) {
        LOG_WARN("Repair command exited with " + std::to_string(outcome.exitCode) + " for " + request.path +
                 ": " + utils::Formatter::truncate(utils::Formatter::trim(outcome.stderrText), 200));
        return "";
    }
    return decodeReply(outcome.stdoutText);
}

}
}
