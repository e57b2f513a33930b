#include "core/dependencies.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace codemend {
namespace core {

namespace {

std::string normalize(const std::string& name) {
    return utils::Formatter::toLower(utils::Formatter::trim(name));
}

}

std::map<std::string, std::vector<std::string>> DependencyResolver::defaultBackendTable() {
    return {
        {"fastapi", {"fastapi", "uvicorn", "pydantic"}},
        {"flask", {"flask", "flask-cors"}},
        {"django", {"django", "djangorestframework"}},
        {"sqlalchemy", {"sqlalchemy", "psycopg2-binary"}},
        {"pydantic", {"pydantic"}},
    };
}

DependencyResolver::DependencyResolver() {
    tables_["backend"] = defaultBackendTable();
}

void DependencyResolver::addMapping(const std::string& role, const std::string& framework,
                                    const std::vector<std::string>& packages) {
    std::lock_guard<std::mutex> lock(mtx_);
    tables_[normalize(role)][normalize(framework)] = packages;
}

bool DependencyResolver::hasMapping(const std::string& role, const std::string& framework) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto table = tables_.find(normalize(role));
    if (table == tables_.end()) return false;
    return table->second.count(normalize(framework)) > 0;
}

std::vector<std::string> DependencyResolver::packagesFor(const std::string& role, const std::string& framework) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto table = tables_.find(normalize(role));
    if (table == tables_.end()) return {};
    auto it = table->second.find(normalize(framework));
    return it != table->second.end() ? it->second : std::vector<std::string>{};
}

size_t DependencyResolver::loadFromConfig(const utils::Config& config) {
    size_t added = 0;
    for (const auto& key : config.keys("deps.")) {
        std::string rest = key.substr(5);
        auto dot = rest.find('.');
        if (dot == std::string::npos || dot == 0 || dot + 1 >= rest.size()) {
            LOG_WARN("Ignoring malformed dependency key: " + key);
            continue;
        }
        addMapping(rest.substr(0, dot), rest.substr(dot + 1), config.getList(key));
        added++;
    }
    return added;
}

std::set<std::string> DependencyResolver::resolve(const TechStack& stack, const std::string& role) const {
    std::set<std::string> packages;
    auto declared = stack.find(role);
    if (declared == stack.end()) return packages;

    std::lock_guard<std::mutex> lock(mtx_);
    auto table = tables_.find(normalize(role));
    if (table == tables_.end()) return packages;

    for (const auto& framework : declared->second) {
        auto it = table->second.find(normalize(framework));
        if (it == table->second.end()) continue;
        packages.insert(it->second.begin(), it->second.end());
    }
    return packages;
}

}
}
