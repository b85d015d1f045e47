#include "session/orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "core/time/clock.hpp"
#include "exec/process_runner.hpp"
#include "snapshot/affected_paths.hpp"

namespace drift::session {

using core::errors::DriftError;
using core::errors::ErrorCategory;
using protocol::ExecutionOutcome;
using protocol::ExecutionResult;
using protocol::HistoryRecord;
using protocol::RecordStatus;
using protocol::RiskLevel;

namespace {

std::string trim(const std::string& text) {
    const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

int first_failure_exit_code(const std::vector<ExecutionResult>& results) {
    for (const auto& result : results) {
        if (result.outcome != ExecutionOutcome::Succeeded &&
            result.outcome != ExecutionOutcome::Skipped) {
            return result.exit_code != 0 ? result.exit_code : 1;
        }
    }
    return 0;
}

// Restores the logger context on every exit path of a run.
class ScopedLogContext {
public:
    explicit ScopedLogContext(const std::string& context) {
        core::logging::Logger::get().set_context(context);
    }
    ~ScopedLogContext() { core::logging::Logger::get().set_context(""); }
};

}  // namespace

Orchestrator::Orchestrator(policy::PlanValidator validator, exec::Executor& executor,
                           snapshot::SnapshotStore& snapshots, HistoryLog& history,
                           OrchestratorOptions options)
    : validator_(std::move(validator)),
      executor_(executor),
      snapshots_(snapshots),
      history_(history),
      options_(std::move(options)) {}

std::string Orchestrator::to_string(const RunState state) {
    switch (state) {
        case RunState::Received:
            return "received";
        case RunState::Validated:
            return "validated";
        case RunState::Blocked:
            return "blocked";
        case RunState::AwaitingConfirmation:
            return "awaiting_confirmation";
        case RunState::Cancelled:
            return "cancelled";
        case RunState::Snapshotting:
            return "snapshotting";
        case RunState::Executing:
            return "executing";
        case RunState::Recorded:
            return "recorded";
        default:
            return "unknown";
    }
}

bool Orchestrator::is_confirmed(const RiskLevel risk, const std::string& answer) {
    const std::string trimmed = trim(answer);
    switch (risk) {
        case RiskLevel::Low:
        case RiskLevel::Medium: {
            const std::string lowered = lowercase(trimmed);
            return lowered == "y" || lowered == "yes";
        }
        case RiskLevel::High:
            return trimmed == "YES";
        default:
            return false;
    }
}

std::string Orchestrator::confirmation_prompt(const RiskLevel risk) {
    if (risk == RiskLevel::High) {
        return "HIGH RISK. Type 'YES' to proceed: ";
    }
    return "Execute these commands? [y/N]: ";
}

void Orchestrator::transition(const RunState next) {
    if (trace_.empty()) {
        DRIFT_LOG_DEBUG("Orchestrator: run " + run_id_ + " entered " + to_string(next));
    } else {
        DRIFT_LOG_DEBUG("Orchestrator: run " + run_id_ + " transition " +
                        to_string(trace_.back()) + " -> " + to_string(next));
    }
    trace_.push_back(next);
}

policy::PlanVerdict Orchestrator::validate(const protocol::Plan& plan) const {
    return validator_.validate(plan);
}

HistoryRecord Orchestrator::new_record(const std::string& query, const protocol::Plan& plan,
                                       const policy::PlanVerdict& verdict) const {
    HistoryRecord record;
    record.ts_unix_ms = core::time::now_unix_ms();
    record.timestamp = core::time::format_iso8601(record.ts_unix_ms);
    record.query = query;
    record.plan = plan;
    record.verdict = verdict.overall;
    record.backend = executor_.name();
    return record;
}

core::errors::Result<HistoryRecord> Orchestrator::run(const std::string& query,
                                                      const protocol::Plan& plan,
                                                      const ConfirmFn& confirm) {
    run_id_ = core::config::generate_run_id();
    ScopedLogContext log_context(run_id_);
    trace_.clear();
    transition(RunState::Received);

    if (plan.needs_clarification()) {
        std::string questions;
        for (const auto& question : plan.clarification_needed) {
            questions += (questions.empty() ? "" : "; ") + question.question;
        }
        return DriftError{ErrorCategory::Input, "Plan needs clarification before it can run.",
                          "clarification_required", questions};
    }

    const policy::PlanVerdict verdict = validator_.validate(plan);
    transition(RunState::Validated);
    DRIFT_LOG_INFO("Plan verdict: " + protocol::to_string(verdict.overall) + " (" +
                   std::to_string(plan.commands.size()) + " commands)");

    if (verdict.blocked()) {
        transition(RunState::Blocked);
        const std::size_t index = verdict.blocked_index.value_or(0);
        const policy::CommandVerdict& offending = verdict.per_command.at(index);

        HistoryRecord record = new_record(query, plan, verdict);
        record.status = RecordStatus::Blocked;
        record.blocked_rule = offending.rule_id;
        record.exit_code = 1;
        auto appended = history_.append(record);
        if (core::errors::is_error(appended)) {
            DRIFT_LOG_ERROR("Unable to record blocked plan: " +
                            core::errors::get_error(appended).message);
        }

        DriftError error{ErrorCategory::Policy,
                         "Command " + std::to_string(index + 1) + " is blocked: " +
                             offending.description,
                         "policy_blocked",
                         "Rephrase the request so it does not need this command."};
        error.rule_id = offending.rule_id;
        error.command_index = index;
        return error;
    }

    if (options_.force_dry_run) {
        HistoryRecord record = new_record(query, plan, verdict);
        record.status = RecordStatus::DryRun;
        for (const auto& command : plan.commands) {
            ExecutionResult preview;
            preview.command = command.command;
            preview.stdout_text = "[DRY RUN] " + command.dry_run.value_or(command.command) + "\n";
            preview.simulated = true;
            record.results.push_back(std::move(preview));
        }
        auto appended = history_.append(record);
        if (core::errors::is_error(appended)) {
            return core::errors::get_error(appended);
        }
        transition(RunState::Recorded);
        DRIFT_LOG_INFO("Dry run recorded, nothing executed.");
        return record;
    }

    transition(RunState::AwaitingConfirmation);
    const std::string answer = confirm ? confirm(confirmation_prompt(verdict.overall)) : "";
    if (!is_confirmed(verdict.overall, answer)) {
        transition(RunState::Cancelled);
        return DriftError{ErrorCategory::Input, "Execution cancelled by user.",
                          "confirmation_rejected"};
    }

    std::optional<std::string> snapshot_id;
    if (!plan.affected_files.empty() || options_.auto_snapshot) {
        transition(RunState::Snapshotting);
        auto taken = take_snapshot(plan);
        if (core::errors::is_error(taken)) {
            const DriftError& error = core::errors::get_error(taken);
            DRIFT_LOG_ERROR("Snapshot failed, nothing executed: " + error.message);
            transition(RunState::Cancelled);
            return error;
        }
        snapshot_id = core::errors::get_value(taken);
    }

    transition(RunState::Executing);
    HistoryRecord record = new_record(query, plan, verdict);
    record.status = RecordStatus::Executed;
    record.snapshot_id = snapshot_id;
    record.results = execute_plan(plan);
    record.exit_code = first_failure_exit_code(record.results);

    auto appended = history_.append(record);
    if (core::errors::is_error(appended)) {
        DRIFT_LOG_ERROR("Commands ran but the history record was lost: " +
                        core::errors::get_error(appended).message);
        return core::errors::get_error(appended);
    }
    transition(RunState::Recorded);
    return record;
}

core::errors::Result<std::optional<std::string>> Orchestrator::take_snapshot(
    const protocol::Plan& plan) {
    const auto paths = snapshot::collect_snapshot_paths(plan, options_.working_directory,
                                                        snapshots_.guard());
    if (paths.empty()) {
        DRIFT_LOG_INFO("No paths to snapshot.");
        return std::optional<std::string>{};
    }

    auto created = snapshots_.create(paths);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    const snapshot::Snapshot& snapshot = core::errors::get_value(created);
    DRIFT_LOG_INFO("Snapshot " + snapshot.id + " covers " +
                   std::to_string(snapshot.entries.size()) + " paths");
    prune_if_needed();
    return std::optional<std::string>{snapshot.id};
}

void Orchestrator::prune_if_needed() {
    if (options_.auto_cleanup_threshold == 0) {
        return;
    }
    auto listed = snapshots_.list();
    if (core::errors::is_error(listed) ||
        core::errors::get_value(listed).size() <= options_.auto_cleanup_threshold) {
        return;
    }
    auto pruned = snapshots_.prune(options_.cleanup_keep, options_.cleanup_days);
    if (core::errors::is_error(pruned)) {
        DRIFT_LOG_WARN("Automatic snapshot cleanup failed: " +
                       core::errors::get_error(pruned).message);
    }
}

std::vector<ExecutionResult> Orchestrator::execute_plan(const protocol::Plan& plan) {
    std::vector<ExecutionResult> results;
    bool stopped = false;

    for (std::size_t i = 0; i < plan.commands.size(); ++i) {
        const protocol::Command& command = plan.commands[i];
        if (stopped) {
            ExecutionResult skipped;
            skipped.command = command.command;
            skipped.exit_code = -1;
            skipped.outcome = ExecutionOutcome::Skipped;
            results.push_back(std::move(skipped));
            continue;
        }

        DRIFT_LOG_INFO("Executing [" + std::to_string(i + 1) + "/" +
                       std::to_string(plan.commands.size()) + "] " + command.command);
        auto executed = executor_.execute(command);
        if (core::errors::is_error(executed)) {
            const DriftError& error = core::errors::get_error(executed);
            DRIFT_LOG_ERROR("Executor failure: " + error.message);
            ExecutionResult failed;
            failed.command = command.command;
            failed.stderr_text = error.message;
            failed.exit_code = exec::kSpawnFailureExitCode;
            failed.outcome = ExecutionOutcome::Failed;
            results.push_back(std::move(failed));
            stopped = true;
            continue;
        }

        ExecutionResult result = core::errors::get_value(executed);
        if (result.outcome != ExecutionOutcome::Succeeded) {
            DRIFT_LOG_WARN("Command " + std::to_string(i + 1) + " ended " +
                           protocol::to_string(result.outcome) + " with exit code " +
                           std::to_string(result.exit_code));
            stopped = !plan.independent;
        }
        results.push_back(std::move(result));
    }
    return results;
}

core::errors::Result<snapshot::RestoreReport> Orchestrator::undo() {
    auto records = history_.recent(0);
    if (core::errors::is_error(records)) {
        return core::errors::get_error(records);
    }

    for (const auto& record : core::errors::get_value(records)) {
        if (record.status != RecordStatus::Executed || !record.snapshot_id.has_value()) {
            continue;
        }
        const std::string& snapshot_id = record.snapshot_id.value();
        auto restored = snapshots_.restore(snapshot_id);
        if (core::errors::is_error(restored)) {
            return core::errors::get_error(restored);
        }

        auto removed = snapshots_.remove(snapshot_id);
        if (core::errors::is_error(removed)) {
            DRIFT_LOG_WARN("Restored snapshot " + snapshot_id + " could not be removed: " +
                           core::errors::get_error(removed).message);
        }
        DRIFT_LOG_INFO("Undid \"" + record.query + "\" from snapshot " + snapshot_id);
        return core::errors::get_value(restored);
    }

    return DriftError{ErrorCategory::Input, "No executed run with a snapshot to undo.",
                      "nothing_to_undo"};
}

core::errors::Result<std::size_t> Orchestrator::cleanup(const std::size_t keep_newest,
                                                        const int older_than_days) {
    return snapshots_.prune(keep_newest, older_than_days);
}

core::errors::Result<std::vector<HistoryRecord>> Orchestrator::history(
    const std::size_t limit) const {
    return history_.recent(limit);
}

core::errors::Result<std::optional<HistoryRecord>> Orchestrator::last_record() const {
    return history_.last();
}

core::errors::Result<std::vector<snapshot::Snapshot>> Orchestrator::list_snapshots() const {
    return snapshots_.list();
}

}  // namespace drift::session
