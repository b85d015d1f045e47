#pragma once

#include <filesystem>
#include <memory>
#include "core/config/drift_config.hpp"
#include "core/errors/drift_errors.hpp"
#include "exec/executor.hpp"

namespace drift::exec {

// Builds the backend named by config.executor_mode. Local mode with a
// sandbox_root is confined like sandbox mode. working_directory is used by
// local runs and as the container mount when no sandbox root is set.
core::errors::Result<std::unique_ptr<Executor>> make_executor(
    const core::config::DriftConfig& config,
    const std::filesystem::path& working_directory);

}  // namespace drift::exec
