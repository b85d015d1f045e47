#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <gtest/gtest.h>
#include "core/config/id_generator.hpp"
#include "core/errors/drift_errors.hpp"
#include "policy/path_guard.hpp"

namespace {

using drift::core::errors::get_error;
using drift::core::errors::get_value;
using drift::core::errors::is_error;
using drift::policy::PathGuard;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_path_guard_" + drift::core::config::generate_run_id());
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

// Unsets an environment variable for the life of the scope.
class ScopedUnsetEnv {
public:
    explicit ScopedUnsetEnv(std::string name) : name_(std::move(name)) {
        const char* value = std::getenv(name_.c_str());
        if (value != nullptr) {
            saved_ = value;
        }
        unsetenv(name_.c_str());
    }

    ~ScopedUnsetEnv() {
        if (saved_.has_value()) {
            setenv(name_.c_str(), saved_->c_str(), 1);
        }
    }

private:
    std::string name_;
    std::optional<std::string> saved_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(PathGuardTest, AllowsPathInsideRoot) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.txt", "ok");

    PathGuard guard({workspace.root()});
    auto result = guard.resolve_within("sub/sample.txt", workspace.root());
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.txt");
}

TEST(PathGuardTest, AllowsMissingPathInsideRoot) {
    TempWorkspace workspace;
    PathGuard guard({workspace.root()});
    EXPECT_TRUE(guard.contains(workspace.root() / "not/yet/created.txt"));
}

TEST(PathGuardTest, RejectsPathOutsideRoot) {
    TempWorkspace workspace;
    PathGuard guard({workspace.root() / "sub"});
    auto result = guard.resolve_within(workspace.root() / "outside.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_violation");
}

TEST(PathGuardTest, RejectsDotDotEscape) {
    TempWorkspace workspace;
    PathGuard guard({workspace.root() / "sub"});
    auto result = guard.resolve_within("../../etc/passwd", workspace.root() / "sub");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_violation");
}

TEST(PathGuardTest, RejectsSymlinkEscape) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "outside");
    std::filesystem::create_directory_symlink(workspace.root() / "outside",
                                              workspace.root() / "sub/link");

    PathGuard guard({workspace.root() / "sub"});
    auto result = guard.resolve_within(workspace.root() / "sub/link/file.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_violation");
}

TEST(PathGuardTest, SiblingWithSharedPrefixIsOutside) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "sub2");
    PathGuard guard({workspace.root() / "sub"});
    EXPECT_FALSE(guard.contains(workspace.root() / "sub2/file.txt"));
}

TEST(PathGuardTest, NoRootsMeansNothingIsAllowed) {
    PathGuard guard({});
    auto result = guard.resolve_within("/tmp/file.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_violation");
}

TEST(PathGuardTest, RejectsEmptyPath) {
    TempWorkspace workspace;
    PathGuard guard({workspace.root()});
    auto result = guard.resolve_within("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(PathGuardTest, IsWithinRootComparesComponents) {
    EXPECT_TRUE(PathGuard::is_within_root("/sandbox", "/sandbox/a/b"));
    EXPECT_TRUE(PathGuard::is_within_root("/sandbox/", "/sandbox/a"));
    EXPECT_TRUE(PathGuard::is_within_root("/sandbox", "/sandbox"));
    EXPECT_FALSE(PathGuard::is_within_root("/sandbox", "/sandboxed/a"));
    EXPECT_FALSE(PathGuard::is_within_root("/sandbox/a", "/sandbox"));
}

TEST(PathGuardTest, ExpandsHome) {
    const auto home = PathGuard::home_directory();
    EXPECT_EQ(PathGuard::expand_home("~"), home);
    EXPECT_EQ(PathGuard::expand_home("~/notes.txt"), home / "notes.txt");
    EXPECT_EQ(PathGuard::expand_home("/etc/hosts"), std::filesystem::path("/etc/hosts"));
}

TEST(PathGuardTest, FilesystemRootIsNeverAnAllowedRoot) {
    PathGuard guard({"/", "relative/dir"});
    EXPECT_TRUE(guard.roots().empty());
    auto result = guard.resolve_within("/etc/hosts");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_violation");
}

TEST(PathGuardTest, UnsetHomeDoesNotWidenToFilesystemRoot) {
    ScopedUnsetEnv no_home("HOME");
    const auto home = PathGuard::home_directory();
    EXPECT_NE(home, std::filesystem::path("/"));

    PathGuard guard({home});
    auto result = guard.resolve_within("/etc/hosts");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_violation");

    if (home.empty()) {
        EXPECT_EQ(PathGuard::expand_home("~/notes.txt"), std::filesystem::path("~/notes.txt"));
    } else {
        EXPECT_EQ(PathGuard::expand_home("~/notes.txt"), home / "notes.txt");
    }
}

}  // namespace
