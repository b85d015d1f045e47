#include "core/config/drift_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>
#include <pwd.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace drift::core::config {

using errors::DriftError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_truthy(const std::string& value) {
    const std::string lowered = lowercase(value);
    return lowered == "1" || lowered == "true" || lowered == "yes";
}

std::filesystem::path account_home() {
    const passwd* entry = getpwuid(getuid());
    if (entry == nullptr || entry->pw_dir == nullptr || *entry->pw_dir == '\0' ||
        std::string(entry->pw_dir) == "/") {
        return {};
    }
    return entry->pw_dir;
}

DriftError invalid_config(const std::string& message) {
    return DriftError{ErrorCategory::Input, message, "invalid_config"};
}

}  // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string to_string(const ExecutorMode mode) {
    switch (mode) {
        case ExecutorMode::Mock:
            return "mock";
        case ExecutorMode::Local:
            return "local";
        case ExecutorMode::Sandbox:
            return "sandbox";
        case ExecutorMode::Container:
            return "docker";
        default:
            return "unknown";
    }
}

std::optional<ExecutorMode> parse_executor_mode(const std::string& text) {
    const std::string lowered = lowercase(text);
    if (lowered == "mock") return ExecutorMode::Mock;
    if (lowered == "local") return ExecutorMode::Local;
    if (lowered == "sandbox") return ExecutorMode::Sandbox;
    if (lowered == "docker" || lowered == "container") return ExecutorMode::Container;
    return std::nullopt;
}

DriftConfig default_config(const EnvLookup& env) {
    DriftConfig config;
    const auto drift_home = env("DRIFT_HOME");
    if (drift_home.has_value() && !drift_home->empty()) {
        config.drift_dir = drift_home.value();
    } else {
        const auto home = env("HOME");
        std::filesystem::path base;
        if (home.has_value() && !home->empty()) {
            base = home.value();
        } else {
            base = account_home();
        }
        // No known home: state lives beside the working directory.
        config.drift_dir = base.empty() ? std::filesystem::path(".drift") : base / ".drift";
    }
    return config;
}

errors::Result<DriftConfig> load_config_file(const std::filesystem::path& path, DriftConfig base) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return base;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return invalid_config("Unable to open config file: " + path.string());
    }
    const json payload = json::parse(in, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return invalid_config("Config file is not a JSON object: " + path.string());
    }

    try {
        if (payload.contains("executor")) {
            const auto mode = parse_executor_mode(payload.at("executor").get<std::string>());
            if (!mode.has_value()) {
                return invalid_config("Unknown executor in config: " +
                                      payload.at("executor").get<std::string>());
            }
            base.executor_mode = mode.value();
        }
        if (payload.contains("sandbox_root") && payload.at("sandbox_root").is_string()) {
            base.sandbox_root = payload.at("sandbox_root").get<std::string>();
        }
        base.force_dry_run = payload.value("dry_run", base.force_dry_run);
        base.auto_snapshot = payload.value("auto_snapshot", base.auto_snapshot);
        base.command_timeout_ms = payload.value("command_timeout_ms", base.command_timeout_ms);
        base.container_runtime = payload.value("container_runtime", base.container_runtime);
        base.container_image = payload.value("container_image", base.container_image);
        base.max_history_bytes = payload.value("max_history_bytes", base.max_history_bytes);
        base.auto_cleanup_threshold =
            payload.value("auto_cleanup_threshold", base.auto_cleanup_threshold);
        base.cleanup_keep = payload.value("cleanup_keep", base.cleanup_keep);
        base.cleanup_days = payload.value("cleanup_days", base.cleanup_days);
    } catch (const json::exception& e) {
        return invalid_config(std::string("Malformed config value: ") + e.what());
    }

    if (base.command_timeout_ms == 0) {
        return invalid_config("command_timeout_ms must be greater than zero.");
    }
    return base;
}

errors::Result<DriftConfig> apply_env_overrides(DriftConfig config, const EnvLookup& env) {
    const auto dry_run = env("DRIFT_DRY_RUN");
    if (dry_run.has_value() && is_truthy(dry_run.value())) {
        config.force_dry_run = true;
    }

    const auto executor = env("DRIFT_EXECUTOR");
    if (executor.has_value() && !executor->empty()) {
        const auto mode = parse_executor_mode(executor.value());
        if (!mode.has_value()) {
            return DriftError{ErrorCategory::Input, "Unknown DRIFT_EXECUTOR: " + executor.value(),
                              "invalid_config", "Use one of mock, local, sandbox, docker."};
        }
        config.executor_mode = mode.value();
    }

    const auto sandbox_root = env("DRIFT_SANDBOX_ROOT");
    if (sandbox_root.has_value() && !sandbox_root->empty()) {
        config.sandbox_root = std::filesystem::path(sandbox_root.value());
    }

    const auto timeout = env("DRIFT_TIMEOUT_MS");
    if (timeout.has_value() && !timeout->empty()) {
        std::uint32_t value = 0;
        const char* begin = timeout->data();
        const char* end = timeout->data() + timeout->size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end || value == 0) {
            return DriftError{ErrorCategory::Input, "Invalid DRIFT_TIMEOUT_MS: " + timeout.value(),
                              "invalid_config", "Provide a positive integer."};
        }
        config.command_timeout_ms = value;
    }

    if (config.executor_mode == ExecutorMode::Sandbox && !config.sandbox_root.has_value()) {
        return DriftError{ErrorCategory::Input, "Sandbox executor requires a sandbox root.",
                          "invalid_config", "Set DRIFT_SANDBOX_ROOT."};
    }
    return config;
}

errors::Result<DriftConfig> load_effective_config(const EnvLookup& env) {
    const DriftConfig defaults = default_config(env);
    auto loaded = load_config_file(defaults.config_file(), defaults);
    if (errors::is_error(loaded)) {
        return errors::get_error(loaded);
    }
    return apply_env_overrides(errors::get_value(loaded), env);
}

}  // namespace drift::core::config
