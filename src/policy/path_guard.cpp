#include "policy/path_guard.hpp"

#include <cstdlib>
#include <system_error>
#include <utility>
#include <pwd.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace drift::policy {

using core::errors::DriftError;
using core::errors::ErrorCategory;

PathGuard::PathGuard(std::vector<std::filesystem::path> allowed_roots) {
    for (auto& root : allowed_roots) {
        if (root.empty()) {
            continue;
        }
        std::error_code ec;
        auto canonical_root = std::filesystem::weakly_canonical(expand_home(root), ec);
        std::filesystem::path resolved = ec ? std::move(root) : std::move(canonical_root);
        if (!resolved.is_absolute() || resolved == resolved.root_path()) {
            DRIFT_LOG_WARN("PathGuard: ignoring allowed root '" + resolved.string() + "'");
            continue;
        }
        roots_.push_back(std::move(resolved));
    }
}

bool PathGuard::is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (root_it->empty()) {
            // Trailing separator of "/sandbox/" iterates as an empty element.
            continue;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    while (root_it != root.end() && root_it->empty()) {
        ++root_it;
    }
    return root_it == root.end();
}

std::filesystem::path PathGuard::home_directory() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') {
        return home;
    }
    const passwd* entry = getpwuid(getuid());
    if (entry != nullptr && entry->pw_dir != nullptr && *entry->pw_dir != '\0' &&
        std::string(entry->pw_dir) != "/") {
        return entry->pw_dir;
    }
    return {};
}

std::filesystem::path PathGuard::expand_home(const std::filesystem::path& path) {
    const std::string text = path.string();
    if (text.empty() || text.front() != '~') {
        return path;
    }
    const std::filesystem::path home = home_directory();
    if (home.empty()) {
        return path;
    }
    if (text == "~") {
        return home;
    }
    if (text.rfind("~/", 0) == 0) {
        return home / text.substr(2);
    }
    return path;
}

core::errors::Result<std::filesystem::path> PathGuard::resolve_within(
    const std::filesystem::path& target, const std::filesystem::path& base) const {
    if (target.empty()) {
        return DriftError{ErrorCategory::Input, "Path cannot be empty.", "invalid_path"};
    }
    if (roots_.empty()) {
        return DriftError{ErrorCategory::Policy, "No allowed root is configured.",
                          "path_violation"};
    }

    std::filesystem::path candidate = expand_home(target);
    if (candidate.is_relative()) {
        std::error_code cwd_ec;
        const auto anchor = base.empty() ? std::filesystem::current_path(cwd_ec) : base;
        if (cwd_ec) {
            return DriftError{ErrorCategory::Internal,
                              "Unable to determine the working directory.", "invalid_path"};
        }
        candidate = anchor / candidate;
    }

    std::error_code ec;
    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return DriftError{ErrorCategory::Policy,
                          "Unable to resolve path: " + target.string(), "path_violation"};
    }

    for (const auto& root : roots_) {
        if (is_within_root(root, canonical_candidate)) {
            return canonical_candidate;
        }
    }

    return DriftError{ErrorCategory::Policy,
                      "Path escapes the allowed roots: " + canonical_candidate.string(),
                      "path_violation"};
}

bool PathGuard::contains(const std::filesystem::path& target,
                         const std::filesystem::path& base) const {
    return !core::errors::is_error(resolve_within(target, base));
}

}  // namespace drift::policy
