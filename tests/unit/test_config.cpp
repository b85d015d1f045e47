#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/drift_config.hpp"
#include "core/config/id_generator.hpp"
#include "core/errors/drift_errors.hpp"

namespace {

using drift::core::config::apply_env_overrides;
using drift::core::config::DriftConfig;
using drift::core::config::EnvLookup;
using drift::core::config::ExecutorMode;
using drift::core::config::load_config_file;
using drift::core::config::load_effective_config;
using drift::core::errors::get_error;
using drift::core::errors::get_value;
using drift::core::errors::is_error;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_config_" + drift::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

EnvLookup fake_env(const std::map<std::string, std::string>& values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(ConfigTest, DefaultsUnderHome) {
    const auto config = drift::core::config::default_config(fake_env({{"HOME", "/home/tester"}}));
    EXPECT_EQ(config.drift_dir, std::filesystem::path("/home/tester/.drift"));
    EXPECT_EQ(config.history_file(), std::filesystem::path("/home/tester/.drift/history.jsonl"));
    EXPECT_EQ(config.executor_mode, ExecutorMode::Local);
    EXPECT_FALSE(config.auto_snapshot);
    EXPECT_FALSE(config.force_dry_run);
    EXPECT_EQ(config.command_timeout_ms, 300000u);
    EXPECT_EQ(config.max_history_bytes, 10u * 1024u * 1024u);
}

TEST(ConfigTest, MissingHomeNeverUsesFilesystemRoot) {
    const auto config = drift::core::config::default_config(fake_env({}));
    EXPECT_NE(config.drift_dir, std::filesystem::path("/.drift"));
    EXPECT_EQ(config.drift_dir.filename(), std::filesystem::path(".drift"));

    const auto blank = drift::core::config::default_config(fake_env({{"HOME", ""}}));
    EXPECT_NE(blank.drift_dir, std::filesystem::path("/.drift"));
}

TEST(ConfigTest, DriftHomeOverridesStateDirectory) {
    const auto config = drift::core::config::default_config(
        fake_env({{"HOME", "/home/tester"}, {"DRIFT_HOME", "/var/drift"}}));
    EXPECT_EQ(config.drift_dir, std::filesystem::path("/var/drift"));
}

TEST(ConfigTest, MissingFileKeepsDefaults) {
    TempWorkspace workspace;
    auto loaded = load_config_file(workspace.root() / "config.json", DriftConfig{});
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).command_timeout_ms, 300000u);
}

TEST(ConfigTest, ReadsConfigFile) {
    TempWorkspace workspace;
    write_file(workspace.root() / "config.json", R"({
        "executor": "docker",
        "container_image": "alpine:3",
        "auto_snapshot": true,
        "command_timeout_ms": 1500
    })");

    auto loaded = load_config_file(workspace.root() / "config.json", DriftConfig{});
    ASSERT_FALSE(is_error(loaded));
    const auto& config = get_value(loaded);
    EXPECT_EQ(config.executor_mode, ExecutorMode::Container);
    EXPECT_EQ(config.container_image, "alpine:3");
    EXPECT_TRUE(config.auto_snapshot);
    EXPECT_EQ(config.command_timeout_ms, 1500u);
}

TEST(ConfigTest, MalformedFileIsInvalidConfig) {
    TempWorkspace workspace;
    write_file(workspace.root() / "config.json", "{\"executor\": ");
    auto loaded = load_config_file(workspace.root() / "config.json", DriftConfig{});
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_config");

    write_file(workspace.root() / "config.json", R"({"command_timeout_ms": "soon"})");
    auto wrong_type = load_config_file(workspace.root() / "config.json", DriftConfig{});
    ASSERT_TRUE(is_error(wrong_type));
    EXPECT_EQ(get_error(wrong_type).code, "invalid_config");
}

TEST(ConfigTest, EnvironmentOverrides) {
    auto applied = apply_env_overrides(
        DriftConfig{}, fake_env({{"DRIFT_DRY_RUN", "TRUE"},
                                 {"DRIFT_EXECUTOR", "sandbox"},
                                 {"DRIFT_SANDBOX_ROOT", "/tmp/sandbox"},
                                 {"DRIFT_TIMEOUT_MS", "2500"}}));
    ASSERT_FALSE(is_error(applied));
    const auto& config = get_value(applied);
    EXPECT_TRUE(config.force_dry_run);
    EXPECT_EQ(config.executor_mode, ExecutorMode::Sandbox);
    EXPECT_EQ(config.sandbox_root.value(), std::filesystem::path("/tmp/sandbox"));
    EXPECT_EQ(config.command_timeout_ms, 2500u);
}

TEST(ConfigTest, DryRunAcceptsOnlyTruthyValues) {
    auto applied = apply_env_overrides(DriftConfig{}, fake_env({{"DRIFT_DRY_RUN", "0"}}));
    ASSERT_FALSE(is_error(applied));
    EXPECT_FALSE(get_value(applied).force_dry_run);
}

TEST(ConfigTest, RejectsBadEnvironmentValues) {
    auto executor = apply_env_overrides(DriftConfig{}, fake_env({{"DRIFT_EXECUTOR", "vm"}}));
    ASSERT_TRUE(is_error(executor));
    EXPECT_EQ(get_error(executor).code, "invalid_config");

    auto timeout = apply_env_overrides(DriftConfig{}, fake_env({{"DRIFT_TIMEOUT_MS", "5s"}}));
    ASSERT_TRUE(is_error(timeout));
    EXPECT_EQ(get_error(timeout).code, "invalid_config");

    auto sandbox = apply_env_overrides(DriftConfig{}, fake_env({{"DRIFT_EXECUTOR", "sandbox"}}));
    ASSERT_TRUE(is_error(sandbox));
    EXPECT_EQ(get_error(sandbox).code, "invalid_config");
}

TEST(ConfigTest, EffectiveConfigLayersFileThenEnvironment) {
    TempWorkspace workspace;
    write_file(workspace.root() / "config.json",
               R"({"executor": "mock", "command_timeout_ms": 1000})");

    auto loaded = load_effective_config(fake_env(
        {{"DRIFT_HOME", workspace.root().string()}, {"DRIFT_TIMEOUT_MS", "2000"}}));
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).executor_mode, ExecutorMode::Mock);
    EXPECT_EQ(get_value(loaded).command_timeout_ms, 2000u);
}

}  // namespace
