#include "exec/sandboxed_executor.hpp"

#include <system_error>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "core/shell/shell_words.hpp"
#include "exec/local_executor.hpp"
#include "exec/process_runner.hpp"
#include "snapshot/affected_paths.hpp"

namespace drift::exec {

namespace {

std::filesystem::path canonical_root(const std::filesystem::path& root) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(root, ec);
    return ec ? root.lexically_normal() : resolved;
}

// "src/*.txt" -> "src", "*.log" -> ".".
std::string glob_parent(const std::string& operand) {
    const auto glob = operand.find_first_of("*?[");
    if (glob == std::string::npos) {
        return operand;
    }
    const auto slash = operand.rfind('/', glob);
    if (slash == std::string::npos) {
        return ".";
    }
    return slash == 0 ? "/" : operand.substr(0, slash);
}

std::vector<std::string> cd_targets(const std::vector<std::string>& segments) {
    std::vector<std::string> targets;
    for (const auto& segment : segments) {
        const auto words = core::shell::split_words(segment);
        if (!words.has_value() || words->empty()) {
            continue;
        }
        const std::string& program = words->front();
        if (program != "cd" && program != "pushd") {
            continue;
        }
        targets.push_back(words->size() > 1 ? (*words)[1] : "~");
    }
    return targets;
}

}  // namespace

SandboxedExecutor::SandboxedExecutor(SandboxOptions options)
    : root_(canonical_root(options.root)),
      timeout_ms_(options.timeout_ms),
      guard_({options.root}) {}

std::optional<std::string> SandboxedExecutor::find_violation(const std::string& command) const {
    const auto segments = core::shell::split_compound(command);
    if (!segments.has_value()) {
        return "command has unbalanced quotes";
    }

    std::vector<std::string> targets = snapshot::mutated_operands(command);
    for (auto& target : cd_targets(segments.value())) {
        targets.push_back(std::move(target));
    }

    for (const auto& target : targets) {
        if (target.find_first_of("$`") != std::string::npos) {
            return "cannot verify expanded target '" + target + "'";
        }
        const std::filesystem::path candidate =
            policy::PathGuard::expand_home(glob_parent(target));
        if (candidate.string().rfind('~', 0) == 0) {
            return "cannot resolve home directory in '" + target + "'";
        }
        auto resolved = guard_.resolve_within(candidate, root_);
        if (core::errors::is_error(resolved)) {
            return "'" + target + "' is outside " + root_.string();
        }
    }
    return std::nullopt;
}

core::errors::Result<protocol::ExecutionResult> SandboxedExecutor::execute(
    const protocol::Command& command) {
    const auto violation = find_violation(command.command);
    if (violation.has_value()) {
        DRIFT_LOG_WARN("Sandbox rejected command: " + violation.value());
        protocol::ExecutionResult result;
        result.command = command.command;
        result.stderr_text = "Sandbox violation: " + violation.value();
        result.exit_code = kRejectedExitCode;
        result.outcome = protocol::ExecutionOutcome::Rejected;
        return result;
    }

    auto argv = command_argv(command.command);
    if (core::errors::is_error(argv)) {
        return core::errors::get_error(argv);
    }

    ProcessSpec spec;
    spec.argv = core::errors::get_value(argv);
    spec.working_directory = root_;
    spec.timeout_ms = timeout_ms_;

    DRIFT_LOG_DEBUG("Sandbox execute in " + root_.string() + ": " + command.command);
    auto capture = run_process(spec);
    if (core::errors::is_error(capture)) {
        return core::errors::get_error(capture);
    }
    return to_execution_result(command.command, core::errors::get_value(capture));
}

}  // namespace drift::exec
