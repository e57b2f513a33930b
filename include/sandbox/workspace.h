#pragma once

#include <filesystem>
#include <string>

namespace codemend {
namespace sandbox {

// Single-use scratch directory that exists for the lifetime of the object.
// Removal in the destructor never throws.
class Workspace {
public:
    // Creates "<parent>/codemend-XXXXXX"; empty parent means the system
    // temp dir. Throws std::runtime_error when the directory cannot be made.
    explicit Workspace(const std::string& parent = "");
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::filesystem::path& root() const { return root_; }

    // Writes a file at a relative path inside the workspace, creating parent
    // directories. Paths escaping the root are rejected with
    // std::invalid_argument.
    std::filesystem::path write(const std::string& relativePath, const std::string& content);

    static bool isSafeRelativePath(const std::string& relativePath);

private:
    std::filesystem::path root_;
};

}
}
