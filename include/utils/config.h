#pragma once

#include "core/options.h"
#include "sandbox/sandbox_config.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace codemend {
namespace utils {

struct LogConfig {
    std::string level = "info";
    std::string file;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool loadDefaults();
    // Overrides every known key from CODEMEND_<KEY>, dots and dashes mapped
    // to underscores and upper-cased. Returns the number of keys overridden.
    size_t loadEnvironment();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);

    std::vector<std::string> keys(const std::string& prefix = "") const;

    sandbox::SandboxConfig getSandboxConfig() const;
    sandbox::RuntimeProfile getRuntimeProfile() const;
    core::EngineOptions getEngineOptions() const;
    LogConfig getLogConfig() const;

    // Effective key/value set as a JSON object, for --print-config.
    std::string toJson() const;

    static std::string environmentName(const std::string& key);

private:
    Config();
    bool lookup(const std::string& key, std::string& out) const;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
