#pragma once

#include "core/self_healing.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace codemend {
namespace core {

// Delegates repair to an external command run through `sh -c`. The request
// goes to its stdin as JSON:
//   {"path", "code", "errors": [...], "stderr", "attempt", "max_attempts"}
// and the corrected source is read from stdout, either raw or as
// {"code": "..."}. A non-zero exit or a timeout yields an empty reply.
class CommandRepairCapability : public RepairCapability {
public:
    explicit CommandRepairCapability(std::string command,
                                     std::chrono::milliseconds timeout = std::chrono::milliseconds(120000),
                                     std::string shell = "/bin/sh");

    std::string repair(const RepairRequest& request) override;

    const std::string& command() const { return command_; }

    static nlohmann::json encodeRequest(const RepairRequest& request);
    static std::string decodeReply(const std::string& stdoutText);

private:
    std::string command_;
    std::chrono::milliseconds timeout_;
    std::string shell_;
};

}
}
