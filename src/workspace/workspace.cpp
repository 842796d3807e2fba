#include "workspace/workspace.hpp"

#include <cerrno>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace runbox::workspace {

using runbox::utils::LogLevel;

Workspace::Workspace(std::filesystem::path root)
    : root_(std::filesystem::absolute(std::move(root)).lexically_normal()) {
    // "dir/" keeps its trailing separator after normalization.
    if (!root_.has_filename() && root_.has_parent_path() && root_ != root_.root_path()) {
        root_ = root_.parent_path();
    }
}

bool Workspace::EnsureExists() const {
    std::error_code ec;
    if (std::filesystem::is_directory(root_, ec)) {
        return true;
    }
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        runbox::utils::Log(LogLevel::kError, "workspace", "failed to create workspace",
                           {{"path", root_.string()}, {"reason", ec.message()}});
        return false;
    }
    runbox::utils::Log(LogLevel::kInfo, "workspace", "created", {{"path", root_.string()}});
    return true;
}

bool Workspace::IsBareName(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    if (filename.find('/') != std::string::npos ||
        filename.find('\\') != std::string::npos ||
        filename.find('\0') != std::string::npos) {
        return false;
    }
    return filename.find("..") == std::string::npos;
}

std::optional<std::filesystem::path> Workspace::Resolve(const std::string& filename) const {
    if (!IsBareName(filename)) {
        return std::nullopt;
    }

    const auto candidate = (root_ / filename).lexically_normal();
    if (candidate.parent_path() != root_ || candidate.filename() != filename) {
        return std::nullopt;
    }

    // A symlinked entry is refused even when its target does not exist yet.
    // The parent is then compared with symlinks followed on both sides.
    std::error_code ec;
    if (std::filesystem::is_symlink(std::filesystem::symlink_status(candidate, ec))) {
        return std::nullopt;
    }
    ec.clear();
    const auto real_root = std::filesystem::weakly_canonical(root_, ec);
    if (ec) {
        return std::nullopt;
    }
    const auto real_candidate = std::filesystem::weakly_canonical(candidate, ec);
    if (ec || real_candidate.parent_path() != real_root) {
        return std::nullopt;
    }
    return candidate;
}

WriteOutcome Workspace::WriteFile(const std::filesystem::path& path,
                                  const std::string& content) const {
    WriteOutcome outcome{};
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644);
    if (fd < 0) {
        outcome.error = std::strerror(errno);
        return outcome;
    }
    std::size_t written = 0;
    while (written < content.size()) {
        const auto n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            outcome.error = std::strerror(errno);
            ::close(fd);
            return outcome;
        }
        written += static_cast<std::size_t>(n);
    }
    if (::close(fd) != 0) {
        outcome.error = "write to " + path.string() + " failed: " + std::strerror(errno);
        return outcome;
    }
    outcome.ok = true;
    return outcome;
}

bool Workspace::RemoveFile(const std::filesystem::path& path) const {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        runbox::utils::Log(LogLevel::kError, "workspace", "failed to remove file",
                           {{"path", path.string()}, {"reason", ec.message()}});
        return false;
    }
    return true;
}

}  // namespace runbox::workspace
