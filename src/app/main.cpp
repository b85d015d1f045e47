#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/config/drift_config.hpp"
#include "core/errors/drift_errors.hpp"
#include "core/logging/logger.hpp"
#include "exec/executor_factory.hpp"
#include "exec/mock_executor.hpp"
#include "policy/path_guard.hpp"
#include "policy/plan_validator.hpp"
#include "protocol/json_codec.hpp"
#include "session/history_log.hpp"
#include "session/orchestrator.hpp"
#include "snapshot/snapshot_store.hpp"

namespace {

using drift::app::cli::CliCommand;
using drift::app::cli::CliRequest;
using drift::core::errors::DriftError;
using drift::core::errors::ErrorCategory;
namespace errors = drift::core::errors;

constexpr int kExitOk = 0;
constexpr int kExitRefused = 1;   // Blocked, cancelled, or a command failed
constexpr int kExitInput = 2;
constexpr int kExitStorage = 3;

int exit_code_for(const DriftError& err) {
    if (err.code == "policy_blocked" || err.code == "confirmation_rejected") {
        return kExitRefused;
    }
    switch (err.category) {
        case ErrorCategory::Input:
            return kExitInput;
        case ErrorCategory::Execution:
            return kExitRefused;
        default:
            return kExitStorage;
    }
}

int report(const DriftError& err) {
    std::string line = "[" + err.code + "] " + err.message;
    if (!err.rule_id.empty()) {
        line += " (rule " + err.rule_id + ")";
    }
    DRIFT_LOG_ERROR(line);
    if (!err.hint.empty()) {
        DRIFT_LOG_INFO("Hint: " + err.hint);
    }
    return exit_code_for(err);
}

errors::Result<drift::protocol::Plan> load_plan(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return DriftError{ErrorCategory::Input, "Unable to read plan file: " + path.string(),
                          "invalid_path"};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return drift::protocol::parse_plan(buffer.str());
}

void print_verdict(const drift::protocol::Plan& plan, const drift::policy::PlanVerdict& verdict) {
    if (!plan.summary.empty()) {
        std::cout << plan.summary << "\n";
    }
    for (std::size_t i = 0; i < plan.commands.size(); ++i) {
        const auto& cmd_verdict = verdict.per_command[i];
        std::cout << "  " << (i + 1) << ". [" << drift::protocol::to_string(cmd_verdict.risk)
                  << "] " << plan.commands[i].command;
        if (!cmd_verdict.rule_id.empty()) {
            std::cout << "  (" << cmd_verdict.rule_id << ")";
        }
        std::cout << "\n";
        if (!plan.commands[i].description.empty()) {
            std::cout << "       " << plan.commands[i].description << "\n";
        }
    }
    std::cout << "Risk: " << drift::protocol::to_string(verdict.overall) << "\n";
    if (!plan.explanation.empty()) {
        std::cout << plan.explanation << "\n";
    }
}

std::string prompt_stdin(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return "";
    }
    return answer;
}

int run_validate(const CliRequest& req, drift::session::Orchestrator& orchestrator) {
    auto plan = load_plan(req.plan_file.value());
    if (errors::is_error(plan)) {
        return report(errors::get_error(plan));
    }
    const auto& parsed = errors::get_value(plan);
    const auto verdict = orchestrator.validate(parsed);
    print_verdict(parsed, verdict);
    return verdict.blocked() ? kExitRefused : kExitOk;
}

int run_plan(const CliRequest& req, drift::session::Orchestrator& orchestrator) {
    auto plan = load_plan(req.plan_file.value());
    if (errors::is_error(plan)) {
        return report(errors::get_error(plan));
    }
    const auto& parsed = errors::get_value(plan);
    print_verdict(parsed, orchestrator.validate(parsed));

    auto ran = orchestrator.run(req.query.empty() ? parsed.summary : req.query, parsed,
                                prompt_stdin);
    if (errors::is_error(ran)) {
        return report(errors::get_error(ran));
    }

    const auto& record = errors::get_value(ran);
    for (const auto& result : record.results) {
        std::cout << "$ " << result.command << "  ["
                  << drift::protocol::to_string(result.outcome) << ", exit "
                  << result.exit_code << "]\n";
        std::cout << result.stdout_text;
        if (!result.stderr_text.empty()) {
            std::cerr << result.stderr_text;
            if (result.stderr_text.back() != '\n') {
                std::cerr << "\n";
            }
        }
    }
    if (record.snapshot_id.has_value()) {
        std::cout << "Snapshot " << record.snapshot_id.value() << " saved; 'drift undo' reverts.\n";
    }
    return record.exit_code == 0 ? kExitOk : kExitRefused;
}

int run_undo(drift::session::Orchestrator& orchestrator) {
    auto restored = orchestrator.undo();
    if (errors::is_error(restored)) {
        return report(errors::get_error(restored));
    }
    const auto& summary = errors::get_value(restored);
    std::cout << "Restored snapshot " << summary.snapshot_id << ": " << summary.restored
              << " restored, " << summary.removed << " removed, " << summary.unchanged
              << " unchanged\n";
    return kExitOk;
}

int run_history(const CliRequest& req, drift::session::Orchestrator& orchestrator) {
    auto records = orchestrator.history(req.limit);
    if (errors::is_error(records)) {
        return report(errors::get_error(records));
    }
    for (const auto& record : errors::get_value(records)) {
        std::cout << record.timestamp << "  " << drift::protocol::to_string(record.status)
                  << "  " << drift::protocol::to_string(record.verdict) << "  exit "
                  << record.exit_code << "  " << record.query;
        if (record.snapshot_id.has_value()) {
            std::cout << "  [snapshot " << record.snapshot_id.value() << "]";
        }
        std::cout << "\n";
    }
    return kExitOk;
}

int run_snapshots(drift::session::Orchestrator& orchestrator) {
    auto snapshots = orchestrator.list_snapshots();
    if (errors::is_error(snapshots)) {
        return report(errors::get_error(snapshots));
    }
    for (const auto& snapshot : errors::get_value(snapshots)) {
        std::cout << snapshot.id << "  " << snapshot.timestamp << "  "
                  << snapshot.entries.size() << " paths  " << snapshot.size_bytes
                  << " bytes\n";
    }
    return kExitOk;
}

int run_cleanup(const CliRequest& req, const drift::core::config::DriftConfig& config,
                drift::session::Orchestrator& orchestrator) {
    auto pruned = orchestrator.cleanup(req.keep.value_or(config.cleanup_keep),
                                       req.days.value_or(config.cleanup_days));
    if (errors::is_error(pruned)) {
        return report(errors::get_error(pruned));
    }
    std::cout << "Deleted " << errors::get_value(pruned) << " snapshots\n";
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = drift::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        DRIFT_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            std::cerr << err.hint << "\n";
        }
        return kExitInput;
    }
    const auto& req = errors::get_value(parsed);
    if (req.verbose) {
        drift::core::logging::Logger::get().set_min_level(drift::core::logging::LogLevel::DEBUG);
    }

    // 2. Effective configuration: defaults, config.json, environment
    auto loaded = drift::core::config::load_effective_config();
    if (errors::is_error(loaded)) {
        return report(errors::get_error(loaded));
    }
    const auto& config = errors::get_value(loaded);
    DRIFT_LOG_DEBUG("State directory: " + config.drift_dir.string() + ", executor: " +
                    drift::core::config::to_string(config.executor_mode));

    // 3. Wire the core
    std::vector<std::filesystem::path> roots = {drift::policy::PathGuard::home_directory()};
    if (roots.front().empty()) {
        DRIFT_LOG_WARN("Home directory unknown; only the sandbox root can be snapshotted.");
    }
    if (config.sandbox_root.has_value()) {
        roots.push_back(config.sandbox_root.value());
    }
    drift::snapshot::SnapshotStore snapshots(config.snapshots_dir(),
                                             drift::policy::PathGuard(roots));
    drift::session::JsonlHistoryLog history(config.history_file(), config.max_history_bytes);

    std::unique_ptr<drift::exec::Executor> executor;
    if (req.command == CliCommand::Run) {
        auto made = drift::exec::make_executor(config, req.working_directory);
        if (errors::is_error(made)) {
            return report(errors::get_error(made));
        }
        executor = std::move(std::get<std::unique_ptr<drift::exec::Executor>>(made));
    } else {
        executor = std::make_unique<drift::exec::MockExecutor>();
    }

    drift::session::OrchestratorOptions options;
    options.working_directory = req.working_directory;
    options.force_dry_run = config.force_dry_run;
    options.auto_snapshot = config.auto_snapshot;
    options.auto_cleanup_threshold = config.auto_cleanup_threshold;
    options.cleanup_keep = config.cleanup_keep;
    options.cleanup_days = config.cleanup_days;
    drift::session::Orchestrator orchestrator(drift::policy::PlanValidator(), *executor,
                                              snapshots, history, options);

    // 4. Dispatch
    switch (req.command) {
        case CliCommand::Validate:
            return run_validate(req, orchestrator);
        case CliCommand::Run:
            return run_plan(req, orchestrator);
        case CliCommand::Undo:
            return run_undo(orchestrator);
        case CliCommand::History:
            return run_history(req, orchestrator);
        case CliCommand::Snapshots:
            return run_snapshots(orchestrator);
        case CliCommand::Cleanup:
            return run_cleanup(req, config, orchestrator);
    }
    return kExitInput;
}
