#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "exec/executor.hpp"
#include "exec/process_runner.hpp"

namespace drift::exec {

struct LocalOptions {
    std::filesystem::path working_directory;  // Empty means the current directory
    std::uint32_t timeout_ms = 300000;
};

// Runs commands on the host as the current user.
class LocalExecutor : public Executor {
public:
    explicit LocalExecutor(LocalOptions options = {});

    core::errors::Result<protocol::ExecutionResult> execute(
        const protocol::Command& command) override;

    std::string name() const override { return "local"; }

    const LocalOptions& options() const { return options_; }

private:
    LocalOptions options_;
};

// Maps a finished process onto the result shape shared by host backends.
protocol::ExecutionResult to_execution_result(const std::string& command,
                                              const ProcessCapture& capture);

}  // namespace drift::exec
