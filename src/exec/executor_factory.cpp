#include "exec/executor_factory.hpp"

#include <system_error>
#include "exec/container_executor.hpp"
#include "exec/local_executor.hpp"
#include "exec/mock_executor.hpp"
#include "exec/sandboxed_executor.hpp"

namespace drift::exec {

using core::config::ExecutorMode;
using core::errors::DriftError;
using core::errors::ErrorCategory;

namespace {

core::errors::Result<std::filesystem::path> existing_directory(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec) || ec) {
        return DriftError{ErrorCategory::Input, "Sandbox root is not a directory: " + path.string(),
                          "invalid_config", "Create the directory or fix DRIFT_SANDBOX_ROOT."};
    }
    return path;
}

}  // namespace

core::errors::Result<std::unique_ptr<Executor>> make_executor(
    const core::config::DriftConfig& config,
    const std::filesystem::path& working_directory) {
    switch (config.executor_mode) {
        case ExecutorMode::Mock:
            return std::unique_ptr<Executor>(std::make_unique<MockExecutor>());

        case ExecutorMode::Local:
            if (!config.sandbox_root.has_value()) {
                return std::unique_ptr<Executor>(std::make_unique<LocalExecutor>(
                    LocalOptions{working_directory, config.command_timeout_ms}));
            }
            [[fallthrough]];

        case ExecutorMode::Sandbox: {
            if (!config.sandbox_root.has_value()) {
                return DriftError{ErrorCategory::Input, "Sandbox executor requires a sandbox root.",
                                  "invalid_config", "Set DRIFT_SANDBOX_ROOT."};
            }
            auto root = existing_directory(config.sandbox_root.value());
            if (core::errors::is_error(root)) {
                return core::errors::get_error(root);
            }
            return std::unique_ptr<Executor>(std::make_unique<SandboxedExecutor>(
                SandboxOptions{core::errors::get_value(root), config.command_timeout_ms}));
        }

        case ExecutorMode::Container: {
            ContainerOptions options;
            options.runtime = config.container_runtime;
            options.image = config.container_image;
            options.mount_root = config.sandbox_root.value_or(working_directory);
            options.timeout_ms = config.command_timeout_ms;
            return std::unique_ptr<Executor>(std::make_unique<ContainerExecutor>(options));
        }

        default:
            return DriftError{ErrorCategory::Internal, "Unknown executor mode.", "invalid_config"};
    }
}

}  // namespace drift::exec
