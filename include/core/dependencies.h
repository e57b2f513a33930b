#pragma once

#include "core/execution_state.h"
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace codemend {
namespace utils { class Config; }

namespace core {

// Maps declared frameworks to installable packages, per stack role.
// Lookups are case-insensitive; unknown frameworks contribute nothing.
class DependencyResolver {
public:
    DependencyResolver();

    void addMapping(const std::string& role, const std::string& framework,
                    const std::vector<std::string>& packages);
    bool hasMapping(const std::string& role, const std::string& framework) const;
    std::vector<std::string> packagesFor(const std::string& role, const std::string& framework) const;

    // Reads `deps.<role>.<framework> = pkg1,pkg2` entries. Returns how many
    // mappings were added or replaced.
    size_t loadFromConfig(const utils::Config& config);

    std::set<std::string> resolve(const TechStack& stack, const std::string& role = "backend") const;

    static std::map<std::string, std::vector<std::string>> defaultBackendTable();

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::map<std::string, std::vector<std::string>>> tables_;
};

}
}
