#include "exec/mock_executor.hpp"

#include "core/logging/logger.hpp"

namespace drift::exec {

core::errors::Result<protocol::ExecutionResult> MockExecutor::execute(
    const protocol::Command& command) {
    executed_.push_back(command.command);
    DRIFT_LOG_DEBUG("Mock execute: " + command.command);

    protocol::ExecutionResult result;
    result.command = command.command;
    result.stdout_text = "[MOCK] Would execute: " + command.command + "\n";
    result.exit_code = 0;
    result.simulated = true;
    result.outcome = protocol::ExecutionOutcome::Succeeded;
    return result;
}

}  // namespace drift::exec
