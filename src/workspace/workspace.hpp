#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace runbox::workspace {

struct WriteOutcome {
    bool ok = false;
    std::string error;
};

// Directory that receives submitted code. Shared, unsynchronized state:
// two requests writing the same filename race on the same file.
class Workspace {
public:
    explicit Workspace(std::filesystem::path root);

    const std::filesystem::path& Root() const { return root_; }

    bool EnsureExists() const;

    // Joins `filename` to the root and returns the result only when it is a
    // direct child of the root. Bare names only: separators, "..", NUL and
    // symlinks leading outside the root are rejected.
    std::optional<std::filesystem::path> Resolve(const std::string& filename) const;

    WriteOutcome WriteFile(const std::filesystem::path& path, const std::string& content) const;
    bool RemoveFile(const std::filesystem::path& path) const;

private:
    static bool IsBareName(const std::string& filename);

    std::filesystem::path root_;
};

}  // namespace runbox::workspace
