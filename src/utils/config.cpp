#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <nlohmann/json.hpp>
#include <map>
#include <unordered_map>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace codemend {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    mutable std::mutex mtx;
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("sandbox.backend", "process");
    set("sandbox.timeout_ms", 30000);
    set("sandbox.memory_limit_mb", 512);
    set("sandbox.cpu_limit", "1.0");
    set("sandbox.max_open_files", 256);
    set("sandbox.network_disabled", false);
    set("sandbox.image", "python:3.11-slim");
    set("sandbox.shell", "/bin/sh");
    set("sandbox.docker_binary", "docker");
    set("sandbox.work_root", "");

    set("engine.max_fix_attempts", 3);
    set("engine.execution_enabled", true);
    set("engine.self_healing_enabled", true);
    set("engine.worker_threads", 1);

    set("runtime.interpreter", "python3");
    set("runtime.extension", ".py");
    set("runtime.manifest", "requirements.txt");
    set("runtime.install_command", "pip install -q -r requirements.txt");
    set("runtime.main_names", "main.py,app.py,run.py,__main__.py");

    // Empty lists keep the built-in signatures.
    set("classifier.error_signatures", "");
    set("classifier.warning_signatures", "");

    set("repair.command", "");
    set("repair.timeout_ms", 120000);

    set("log.level", "info");
    set("log.file", "");

    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
    }
    loadDefaults();
}

namespace {

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::map<std::string, std::string> parsed;
    std::string line;
    int lineNo = 0;
    while (std::getline(file, line)) {
        lineNo++;
        std::string trimmed = Formatter::trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') continue;

        auto pos = trimmed.find('=');
        std::string key = pos == std::string::npos ? "" : Formatter::trim(trimmed.substr(0, pos));
        if (key.empty()) {
            LOG_WARN(path + ":" + std::to_string(lineNo) + ": ignoring malformed line");
            continue;
        }
        parsed[key] = unquote(Formatter::trim(trimmed.substr(pos + 1)));
    }

    std::lock_guard<std::mutex> lock(impl_->mtx);
    for (auto& [key, value] : parsed) {
        impl_->data[key] = std::move(value);
    }
    return true;
}

std::string Config::environmentName(const std::string& key) {
    std::string name = "CODEMEND_";
    for (char c : key) {
        if (c == '.' || c == '-') {
            name += '_';
        } else {
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return name;
}

size_t Config::loadEnvironment() {
    size_t overridden = 0;
    for (const auto& key : keys()) {
        const char* value = std::getenv(environmentName(key).c_str());
        if (!value) continue;
        set(key, std::string(value));
        overridden++;
    }
    return overridden;
}

bool Config::lookup(const std::string& key, std::string& out) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return false;
    out = it->second;
    return true;
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::string raw;
    return lookup(key, raw) ? raw : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::string raw;
    if (!lookup(key, raw)) return def;
    try { return std::stoi(raw); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::string raw;
    if (!lookup(key, raw)) return def;
    try { return std::stoll(raw); }
    catch (const std::exception&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::string raw;
    if (!lookup(key, raw)) return def;
    try { return std::stod(raw); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::string raw;
    if (!lookup(key, raw)) return def;
    std::string val = Formatter::toLower(Formatter::trim(raw));
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    return def;
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::vector<std::string> result;
    for (const auto& item : Formatter::split(getString(key), ',')) {
        std::string trimmed = Formatter::trim(item);
        if (!trimmed.empty()) result.push_back(trimmed);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = value;
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int value) { set(key, std::to_string(value)); }
void Config::set(const std::string& key, bool value) { set(key, std::string(value ? "true" : "false")); }

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

sandbox::RuntimeProfile Config::getRuntimeProfile() const {
    sandbox::RuntimeProfile profile;
    profile.interpreter = getString("runtime.interpreter", profile.interpreter);
    profile.sourceExtension = getString("runtime.extension", profile.sourceExtension);
    profile.manifestName = getString("runtime.manifest", profile.manifestName);
    profile.installCommand = getString("runtime.install_command", profile.installCommand);
    auto names = getList("runtime.main_names");
    if (!names.empty()) profile.mainNames = names;
    return profile;
}

sandbox::SandboxConfig Config::getSandboxConfig() const {
    sandbox::SandboxConfig cfg;
    cfg.backend = sandbox::parseBackendKind(getString("sandbox.backend", "process"));
    cfg.timeoutMs = static_cast<uint32_t>(std::max(1, getInt("sandbox.timeout_ms", 30000)));
    cfg.memoryLimit = static_cast<uint64_t>(std::max<int64_t>(1, getInt64("sandbox.memory_limit_mb", 512))) * 1024 * 1024;
    cfg.cpuLimit = getDouble("sandbox.cpu_limit", 1.0);
    if (cfg.cpuLimit <= 0.0) cfg.cpuLimit = 1.0;
    cfg.maxOpenFiles = static_cast<uint32_t>(std::max(0, getInt("sandbox.max_open_files", 256)));
    cfg.networkDisabled = getBool("sandbox.network_disabled", false);
    cfg.image = getString("sandbox.image", cfg.image);
    cfg.shell = getString("sandbox.shell", cfg.shell);
    cfg.dockerBinary = getString("sandbox.docker_binary", cfg.dockerBinary);
    cfg.workRoot = getString("sandbox.work_root", "");
    cfg.runtime = getRuntimeProfile();
    return cfg;
}

core::EngineOptions Config::getEngineOptions() const {
    core::EngineOptions options;
    options.executionEnabled = getBool("engine.execution_enabled", true);
    options.selfHealingEnabled = getBool("engine.self_healing_enabled", true);
    options.maxFixAttempts = getInt("engine.max_fix_attempts", 3);
    options.workerThreads = static_cast<size_t>(std::max(1, getInt("engine.worker_threads", 1)));
    return options;
}

LogConfig Config::getLogConfig() const {
    LogConfig cfg;
    cfg.level = getString("log.level", "info");
    cfg.file = getString("log.file", "");
    return cfg;
}

std::string Config::toJson() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [k, v] : impl_->data) {
        j[k] = v;
    }
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
}
