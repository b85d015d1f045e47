#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/drift_errors.hpp"

namespace drift::core::config {

enum class ExecutorMode {
    Mock,
    Local,
    Sandbox,
    Container
};

struct DriftConfig {
    std::filesystem::path drift_dir;                 // State directory, ~/.drift by default
    ExecutorMode executor_mode = ExecutorMode::Local;
    std::optional<std::filesystem::path> sandbox_root;
    bool force_dry_run = false;
    bool auto_snapshot = false;                      // Snapshot even without declared files
    std::uint32_t command_timeout_ms = 300000;
    std::string container_runtime = "docker";
    std::string container_image = "ubuntu:latest";
    std::uintmax_t max_history_bytes = 10u * 1024u * 1024u;
    std::size_t auto_cleanup_threshold = 100;        // Snapshot count that triggers pruning
    std::size_t cleanup_keep = 50;
    int cleanup_days = 30;

    std::filesystem::path history_file() const { return drift_dir / "history.jsonl"; }
    std::filesystem::path snapshots_dir() const { return drift_dir / "snapshots"; }
    std::filesystem::path config_file() const { return drift_dir / "config.json"; }
};

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> process_env(const std::string& name);

DriftConfig default_config(const EnvLookup& env = process_env);

// Overlays config.json onto base. A missing file is not an error.
errors::Result<DriftConfig> load_config_file(const std::filesystem::path& path, DriftConfig base);

// DRIFT_DRY_RUN, DRIFT_EXECUTOR, DRIFT_SANDBOX_ROOT, DRIFT_TIMEOUT_MS.
errors::Result<DriftConfig> apply_env_overrides(DriftConfig config, const EnvLookup& env = process_env);

// defaults -> <drift_dir>/config.json -> environment.
errors::Result<DriftConfig> load_effective_config(const EnvLookup& env = process_env);

std::string to_string(ExecutorMode mode);
std::optional<ExecutorMode> parse_executor_mode(const std::string& text);

}  // namespace drift::core::config
