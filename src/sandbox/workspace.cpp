#include "sandbox/workspace.h"
#include "utils/logger.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <stdlib.h>

namespace codemend {
namespace sandbox {

Workspace::Workspace(const std::string& parent) {
    std::error_code ec;
    std::filesystem::path base = parent.empty() ? std::filesystem::temp_directory_path(ec) : std::filesystem::path(parent);
    if (ec) base = "/tmp";
    std::filesystem::create_directories(base, ec);

    std::string pattern = (base / "codemend-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error("Failed to create workspace under " + base.string() + ": " + std::strerror(errno));
    }
    root_ = std::filesystem::path(buf.data());
}

Workspace::~Workspace() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    if (ec) {
        LOG_WARN("Failed to remove workspace " + root_.string() + ": " + ec.message());
    }
}

bool Workspace::isSafeRelativePath(const std::string& relativePath) {
    if (relativePath.empty()) return false;
    std::filesystem::path p(relativePath);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return p.has_filename();
}

std::filesystem::path Workspace::write(const std::string& relativePath, const std::string& content) {
    if (!isSafeRelativePath(relativePath)) {
        throw std::invalid_argument("Unsafe workspace path: " + relativePath);
    }
    std::filesystem::path target = root_ / relativePath;
    std::filesystem::create_directories(target.parent_path());

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to write " + target.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw std::runtime_error("Failed to write " + target.string());
    }
    return target;
}

}
}
