#include "exec/container_executor.hpp"

#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "exec/local_executor.hpp"
#include "exec/process_runner.hpp"

namespace drift::exec {

ContainerExecutor::ContainerExecutor(ContainerOptions options) : options_(std::move(options)) {}

std::vector<std::string> ContainerExecutor::container_argv(const std::string& container_name,
                                                           const std::string& command) const {
    return {options_.runtime,
            "run",
            "--rm",
            "--name",
            container_name,
            "-v",
            options_.mount_root.string() + ":/work",
            "-w",
            "/work",
            options_.image,
            "sh",
            "-c",
            command};
}

core::errors::Result<protocol::ExecutionResult> ContainerExecutor::execute(
    const protocol::Command& command) {
    const std::string container_name = "drift-" + core::config::random_hex(12);

    ProcessSpec spec;
    spec.argv = container_argv(container_name, command.command);
    spec.working_directory = options_.mount_root;
    spec.timeout_ms = options_.timeout_ms;

    DRIFT_LOG_DEBUG("Container " + container_name + " execute: " + command.command);
    auto capture = run_process(spec);
    if (core::errors::is_error(capture)) {
        return core::errors::get_error(capture);
    }

    const ProcessCapture& finished = core::errors::get_value(capture);
    if (finished.timed_out) {
        // Killing the client leaves the container running.
        ProcessSpec kill_spec;
        kill_spec.argv = {options_.runtime, "kill", container_name};
        kill_spec.timeout_ms = 10000;
        auto killed = run_process(kill_spec);
        if (core::errors::is_error(killed) || core::errors::get_value(killed).exit_code != 0) {
            DRIFT_LOG_WARN("Unable to stop container " + container_name);
        }
    }
    return to_execution_result(command.command, finished);
}

}  // namespace drift::exec
