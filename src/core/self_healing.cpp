#include "core/self_healing.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace codemend {
namespace core {

FunctionRepairCapability::FunctionRepairCapability(RepairFn fn) : fn_(std::move(fn)) {}

std::string FunctionRepairCapability::repair(const RepairRequest& request) {
    return fn_ ? fn_(request) : std::string();
}

std::string stripCodeFences(const std::string& text) {
    const std::string fence = "```";
    size_t open = text.find(fence);
    if (open == std::string::npos) {
        return utils::Formatter::trim(text);
    }

    size_t bodyStart = text.find('\n', open + fence.size());
    if (bodyStart == std::string::npos) {
        return "";
    }
    bodyStart++;

    size_t close = text.find(fence, bodyStart);
    std::string body = close == std::string::npos ? text.substr(bodyStart)
                                                  : text.substr(bodyStart, close - bodyStart);
    return utils::Formatter::trim(body);
}

SelfHealingLoop::SelfHealingLoop(RepairCapability& capability) : capability_(capability) {}

size_t SelfHealingLoop::repair(FileSet& files, ExecutionState& state) {
    size_t consumed = 0;

    for (const auto& [path, errs] : state.errors) {
        int attempts = state.attemptsOf(path);
        if (attempts >= state.maxFixAttempts) {
            LOG_WARN("Max fix attempts reached for " + path);
            continue;
        }

        auto file = files.find(path);
        if (file == files.end()) {
            LOG_WARN("Skipping repair of " + path + ": not in file set");
            continue;
        }

        RepairRequest request;
        request.path = path;
        request.code = file->second;
        request.errors = errs;
        auto last = state.results.find(path);
        if (last != state.results.end()) {
            request.stderrExcerpt = last->second.stderrExcerpt(kStderrExcerptChars);
        }
        request.attempt = attempts + 1;
        request.maxAttempts = state.maxFixAttempts;

        LOG_INFO("Fixing " + path + " (attempt " + std::to_string(request.attempt) + "/" +
                 std::to_string(state.maxFixAttempts) + ")");

        std::string reply;
        std::string failure;
        try {
            reply = capability_.repair(request);
        } catch (const std::exception& e) {
            failure = std::string("repair capability threw: ") + e.what();
        }

        std::string fixed = stripCodeFences(reply);
        if (!fixed.empty()) {
            file->second = fixed;
            state.recordRepair(path, true, ErrorCode::OK, "replaced " + std::to_string(fixed.size()) + " bytes");
            LOG_INFO("Applied fix to " + path);
        } else {
            if (failure.empty()) failure = "repair capability returned no code";
            state.recordRepair(path, false, ErrorCode::REPAIR_FAILED, failure);
            LOG_WARN("Repair failed for " + path + ": " + failure);
        }
        consumed++;
    }
    return consumed;
}

}
}
