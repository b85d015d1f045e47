#include "exec/local_executor.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace drift::exec {

protocol::ExecutionResult to_execution_result(const std::string& command,
                                              const ProcessCapture& capture) {
    protocol::ExecutionResult result;
    result.command = command;
    result.stdout_text = capture.stdout_text;
    result.stderr_text = capture.stderr_text;
    result.exit_code = capture.exit_code;
    result.duration_ms = capture.duration_ms;
    if (capture.timed_out) {
        result.outcome = protocol::ExecutionOutcome::TimedOut;
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
            result.stderr_text += "\n";
        }
        result.stderr_text += "Command timed out.";
    } else if (capture.exit_code == 0) {
        result.outcome = protocol::ExecutionOutcome::Succeeded;
    } else {
        result.outcome = protocol::ExecutionOutcome::Failed;
    }
    return result;
}

LocalExecutor::LocalExecutor(LocalOptions options) : options_(std::move(options)) {}

core::errors::Result<protocol::ExecutionResult> LocalExecutor::execute(
    const protocol::Command& command) {
    auto argv = command_argv(command.command);
    if (core::errors::is_error(argv)) {
        return core::errors::get_error(argv);
    }

    ProcessSpec spec;
    spec.argv = core::errors::get_value(argv);
    spec.working_directory = options_.working_directory;
    spec.timeout_ms = options_.timeout_ms;

    DRIFT_LOG_DEBUG("Local execute: " + command.command);
    auto capture = run_process(spec);
    if (core::errors::is_error(capture)) {
        return core::errors::get_error(capture);
    }
    return to_execution_result(command.command, core::errors::get_value(capture));
}

}  // namespace drift::exec
