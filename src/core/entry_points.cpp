#include "core/entry_points.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>
#include <filesystem>

namespace codemend {
namespace core {

namespace {

std::string fileName(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

bool isRootLevel(const std::string& path) {
    return path.find('/') == std::string::npos;
}

}

MainNamePredicate::MainNamePredicate(std::vector<std::string> names) : names_(std::move(names)) {}

bool MainNamePredicate::matches(const std::string& path, const std::string&) const {
    std::string base = fileName(path);
    return std::find(names_.begin(), names_.end(), base) != names_.end();
}

InvocationGuardPredicate::InvocationGuardPredicate()
    : guard_(R"(^if\s*\(?\s*(__name__\s*==\s*(['"])__main__\2|(['"])__main__\3\s*==\s*__name__)\s*\)?\s*:)") {}

bool InvocationGuardPredicate::matches(const std::string&, const std::string& content) const {
    if (content.find("__main__") == std::string::npos) return false;
    for (const auto& raw : utils::Formatter::splitLines(content)) {
        std::string line = utils::Formatter::trim(raw);
        if (line.empty() || line[0] == '#') continue;
        if (std::regex_search(line, guard_)) return true;
    }
    return false;
}

bool SubstringGuardPredicate::matches(const std::string&, const std::string& content) const {
    return content.find("__name__") != std::string::npos &&
           content.find("__main__") != std::string::npos;
}

EntryPointResolver::EntryPointResolver(const sandbox::RuntimeProfile& runtime) : runtime_(runtime) {
    predicates_.push_back(std::make_unique<MainNamePredicate>(runtime.mainNames));
    predicates_.push_back(std::make_unique<InvocationGuardPredicate>());
}

EntryPointResolver::EntryPointResolver(const sandbox::RuntimeProfile& runtime,
                                       std::vector<std::unique_ptr<EntryPointPredicate>> predicates)
    : runtime_(runtime), predicates_(std::move(predicates)) {}

void EntryPointResolver::addPredicate(std::unique_ptr<EntryPointPredicate> predicate) {
    if (predicate) predicates_.push_back(std::move(predicate));
}

void EntryPointResolver::clearPredicates() {
    predicates_.clear();
}

bool EntryPointResolver::isEntryPoint(const std::string& path, const std::string& content) const {
    for (const auto& predicate : predicates_) {
        if (predicate->matches(path, content)) return true;
    }
    return false;
}

std::string EntryPointResolver::fallback(const FileSet& files) const {
    const std::string& ext = runtime_.sourceExtension;
    for (const auto& [path, content] : files) {
        if (isRootLevel(path) && utils::Formatter::endsWith(path, ext)) return path;
    }
    for (const auto& [path, content] : files) {
        if (utils::Formatter::endsWith(path, ext)) return path;
    }
    return files.begin()->first;
}

std::vector<std::string> EntryPointResolver::resolve(const FileSet& files) const {
    std::vector<std::string> entries;
    if (files.empty()) return entries;

    // Only runnable sources are candidates; data files ride along.
    for (const auto& [path, content] : files) {
        if (!utils::Formatter::endsWith(path, runtime_.sourceExtension)) continue;
        if (isEntryPoint(path, content)) entries.push_back(path);
    }

    if (entries.empty()) {
        std::string chosen = fallback(files);
        LOG_DEBUG("No entry point detected, falling back to " + chosen);
        entries.push_back(chosen);
    }
    return entries;
}

}
}
