#pragma once

#include "core/execution_state.h"
#include "sandbox/sandbox_config.h"
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace codemend {
namespace core {

class EntryPointPredicate {
public:
    virtual ~EntryPointPredicate() = default;
    virtual std::string name() const = 0;
    virtual bool matches(const std::string& path, const std::string& content) const = 0;
};

// File name (not path) is one of the conventional main names.
class MainNamePredicate : public EntryPointPredicate {
public:
    explicit MainNamePredicate(std::vector<std::string> names);

    std::string name() const override { return "main_name"; }
    bool matches(const std::string& path, const std::string& content) const override;

private:
    std::vector<std::string> names_;
};

// `if __name__ == "__main__":` at the start of a non-comment line, either
// quote style and either operand order.
class InvocationGuardPredicate : public EntryPointPredicate {
public:
    InvocationGuardPredicate();

    std::string name() const override { return "invocation_guard"; }
    bool matches(const std::string& path, const std::string& content) const override;

private:
    std::regex guard_;
};

// Content mentions both `__name__` and `__main__` anywhere.
class SubstringGuardPredicate : public EntryPointPredicate {
public:
    std::string name() const override { return "substring_guard"; }
    bool matches(const std::string& path, const std::string& content) const override;
};

class EntryPointResolver {
public:
    // Main-name and invocation-guard predicates for the given runtime.
    explicit EntryPointResolver(const sandbox::RuntimeProfile& runtime = sandbox::RuntimeProfile());
    EntryPointResolver(const sandbox::RuntimeProfile& runtime,
                       std::vector<std::unique_ptr<EntryPointPredicate>> predicates);

    void addPredicate(std::unique_ptr<EntryPointPredicate> predicate);
    void clearPredicates();
    size_t predicateCount() const { return predicates_.size(); }

    bool isEntryPoint(const std::string& path, const std::string& content) const;

    // Lexically ordered; never empty for a non-empty file set.
    std::vector<std::string> resolve(const FileSet& files) const;

private:
    std::string fallback(const FileSet& files) const;

    sandbox::RuntimeProfile runtime_;
    std::vector<std::unique_ptr<EntryPointPredicate>> predicates_;
};

}
}
