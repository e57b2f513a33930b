#include "core/report.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace codemend {
namespace core {

namespace {

bool readFile(const std::filesystem::path& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

bool isSkippedName(const std::string& name) {
    return name.empty() || name[0] == '.' || name == "__pycache__";
}

}

Result<ProjectInput> loadDirectory(const std::string& dir, uint64_t maxFileBytes) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return makeError(ErrorCode::IO_ERROR, "Not a directory: " + dir);
    }

    ProjectInput input;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return makeError(ErrorCode::IO_ERROR, "Cannot read directory " + dir + ": " + ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return makeError(ErrorCode::IO_ERROR, "Directory walk failed in " + dir + ": " + ec.message());
        }
        std::string name = it->path().filename().string();
        if (isSkippedName(name)) {
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec)) continue;

        uint64_t size = it->file_size(ec);
        if (ec || size > maxFileBytes) {
            LOG_WARN("Skipping " + it->path().string() + " (" + utils::Formatter::formatBytes(size) + ")");
            ec.clear();
            continue;
        }

        std::string content;
        if (!readFile(it->path(), content)) {
            return makeError(ErrorCode::IO_ERROR, "Cannot read " + it->path().string());
        }
        std::string rel = fs::relative(it->path(), dir, ec).generic_string();
        if (ec) {
            return makeError(ErrorCode::IO_ERROR, "Cannot relativize " + it->path().string());
        }
        input.files[rel] = std::move(content);
    }

    LOG_INFO("Loaded " + std::to_string(input.files.size()) + " file(s) from " + dir);
    return input;
}

Result<ProjectInput> parseManifest(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return makeError(ErrorCode::INVALID_FILE_SET, "Manifest is not a JSON object");
    }
    if (!j.contains("files") || !j["files"].is_object()) {
        return makeError(ErrorCode::INVALID_FILE_SET, "Manifest has no \"files\" object");
    }

    ProjectInput input;
    for (auto it = j["files"].begin(); it != j["files"].end(); ++it) {
        if (!it.value().is_string()) {
            return makeError(ErrorCode::INVALID_FILE_SET, "File content must be a string: " + it.key());
        }
        if (!isValidFilePath(it.key())) {
            return makeError(ErrorCode::INVALID_FILE_SET, "Invalid file path in manifest: '" + it.key() + "'");
        }
        input.files[it.key()] = it.value().get<std::string>();
    }

    if (j.contains("tech_stack")) {
        const auto& stack = j["tech_stack"];
        if (!stack.is_object()) {
            return makeError(ErrorCode::INVALID_FILE_SET, "\"tech_stack\" must be an object");
        }
        for (auto it = stack.begin(); it != stack.end(); ++it) {
            std::vector<std::string> names;
            if (it.value().is_string()) {
                names.push_back(it.value().get<std::string>());
            } else if (it.value().is_array()) {
                for (const auto& name : it.value()) {
                    if (name.is_string()) names.push_back(name.get<std::string>());
                }
            }
            input.techStack[it.key()] = names;
        }
    }
    return input;
}

Result<ProjectInput> loadManifest(const std::string& path) {
    std::string text;
    if (!readFile(path, text)) {
        return makeError(ErrorCode::IO_ERROR, "Cannot read manifest " + path);
    }
    return parseManifest(text);
}

bool parseStackSpec(const std::string& spec, TechStack& stack) {
    auto eq = spec.find('=');
    if (eq == std::string::npos || eq == 0) return false;
    std::string role = utils::Formatter::trim(spec.substr(0, eq));
    if (role.empty()) return false;
    auto& names = stack[role];
    for (const auto& name : utils::Formatter::split(spec.substr(eq + 1), ',')) {
        std::string trimmed = utils::Formatter::trim(name);
        if (!trimmed.empty()) names.push_back(trimmed);
    }
    return true;
}

nlohmann::json resultToJson(const sandbox::ExecutionResult& result) {
    nlohmann::json j;
    j["success"] = result.success();
    j["exit_code"] = result.exitCode();
    j["duration_ms"] = result.duration().count();
    j["stdout"] = result.stdoutText();
    j["stderr"] = result.stderrText();
    j["errors"] = result.errors();
    j["warnings"] = result.warnings();
    j["failure"] = errorCodeName(result.failureKind());
    j["retryable"] = isRetryable(result.failureKind());
    j["summary"] = result.errorSummary();
    return j;
}

nlohmann::json outcomeToJson(const HealingOutcome& outcome) {
    const ExecutionState& state = outcome.state;
    nlohmann::json j;
    j["succeeded"] = outcome.succeeded();
    j["cycles"] = state.cycles;
    j["cancelled"] = state.cancelled;
    j["max_fix_attempts"] = state.maxFixAttempts;
    j["needs_revision"] = state.needsRevision();
    if (state.hasFatal()) {
        j["fatal"] = {{"code", errorCodeName(state.fatal.code)}, {"message", state.fatal.message}};
    } else {
        j["fatal"] = nullptr;
    }

    nlohmann::json files = nlohmann::json::object();
    for (const auto& [path, result] : state.results) {
        nlohmann::json f;
        f["status"] = fileStatusName(state.statusOf(path));
        f["fix_attempts"] = state.attemptsOf(path);
        f["result"] = resultToJson(result);
        auto errs = state.errors.find(path);
        f["errors"] = errs != state.errors.end() ? nlohmann::json(errs->second) : nlohmann::json::array();
        files[path] = f;
    }
    j["files"] = files;

    nlohmann::json repairs = nlohmann::json::array();
    for (const auto& r : state.repairs) {
        repairs.push_back({{"path", r.path}, {"attempt", r.attempt}, {"applied", r.applied},
                           {"code", errorCodeName(r.code)}, {"message", r.message}});
    }
    j["repairs"] = repairs;
    return j;
}

Result<void> writeReport(const std::string& path, const HealingOutcome& outcome) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return makeError(ErrorCode::IO_ERROR, "Cannot open report file " + path);
    }
    out << outcomeToJson(outcome).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    if (!out) {
        return makeError(ErrorCode::IO_ERROR, "Failed writing report " + path);
    }
    return Result<void>();
}

Result<void> writeFiles(const std::string& dir, const FileSet& files) {
    namespace fs = std::filesystem;
    for (const auto& [rel, content] : files) {
        if (!isValidFilePath(rel)) {
            return makeError(ErrorCode::INVALID_FILE_SET, "Refusing to write outside " + dir + ": " + rel);
        }
        fs::path target = fs::path(dir) / rel;
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return makeError(ErrorCode::IO_ERROR, "Cannot create " + target.parent_path().string() + ": " + ec.message());
        }
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return makeError(ErrorCode::IO_ERROR, "Cannot write " + target.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            return makeError(ErrorCode::IO_ERROR, "Failed writing " + target.string());
        }
    }
    return Result<void>();
}

}
}
