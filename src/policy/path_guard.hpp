#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/drift_errors.hpp"

namespace drift::policy {

// Confines filesystem targets to a set of allowed roots. Targets are resolved
// (symlinks and ".." included) before the containment check. Relative roots
// and the filesystem root itself are never accepted as allowed roots.
class PathGuard {
public:
    explicit PathGuard(std::vector<std::filesystem::path> allowed_roots);

    // Resolves target (relative targets against base, "~" against $HOME) and
    // fails with path_violation unless it lands inside one allowed root.
    core::errors::Result<std::filesystem::path> resolve_within(
        const std::filesystem::path& target,
        const std::filesystem::path& base = {}) const;

    bool contains(const std::filesystem::path& target,
                  const std::filesystem::path& base = {}) const;

    const std::vector<std::filesystem::path>& roots() const { return roots_; }

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::filesystem::path expand_home(const std::filesystem::path& path);
    // $HOME, else the password database entry; empty when neither is known
    // or the entry is "/".
    static std::filesystem::path home_directory();

private:
    std::vector<std::filesystem::path> roots_;
};

}  // namespace drift::policy
