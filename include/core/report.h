#pragma once

#include "core/engine.h"
#include "core/execution_state.h"
#include "infrastructure/error_handling.h"
#include <nlohmann/json.hpp>
#include <string>

namespace codemend {
namespace core {

struct ProjectInput {
    FileSet files;
    TechStack techStack;
};

// Reads every regular file under `dir` (hidden entries and __pycache__
// skipped) keyed by its relative path.
Result<ProjectInput> loadDirectory(const std::string& dir, uint64_t maxFileBytes = 1024 * 1024);

// {"files": {path: code}, "tech_stack": {role: [names]}}
Result<ProjectInput> parseManifest(const std::string& text);
Result<ProjectInput> loadManifest(const std::string& path);

// Parses "role=a,b" into the stack. Returns false for a malformed spec.
bool parseStackSpec(const std::string& spec, TechStack& stack);

nlohmann::json resultToJson(const sandbox::ExecutionResult& result);
nlohmann::json outcomeToJson(const HealingOutcome& outcome);

Result<void> writeReport(const std::string& path, const HealingOutcome& outcome);
// Writes the (possibly repaired) files back under `dir`.
Result<void> writeFiles(const std::string& dir, const FileSet& files);

}
}
