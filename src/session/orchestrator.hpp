#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/drift_errors.hpp"
#include "exec/executor.hpp"
#include "policy/plan_validator.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "session/history_log.hpp"
#include "snapshot/snapshot_store.hpp"

namespace drift::session {

enum class RunState {
    Received,
    Validated,
    Blocked,
    AwaitingConfirmation,
    Cancelled,
    Snapshotting,
    Executing,
    Recorded
};

// Shown the prompt, returns what the user typed.
using ConfirmFn = std::function<std::string(const std::string& prompt)>;

struct OrchestratorOptions {
    std::filesystem::path working_directory;   // Base for relative affected files
    bool force_dry_run = false;
    bool auto_snapshot = false;
    std::size_t auto_cleanup_threshold = 0;    // 0 disables pruning after snapshots
    std::size_t cleanup_keep = 50;
    int cleanup_days = 30;
};

class Orchestrator {
public:
    Orchestrator(policy::PlanValidator validator, exec::Executor& executor,
                 snapshot::SnapshotStore& snapshots, HistoryLog& history,
                 OrchestratorOptions options);

    policy::PlanVerdict validate(const protocol::Plan& plan) const;

    // Validate, confirm, snapshot, execute, record. A blocked plan is recorded
    // and returned as policy_blocked; a declined confirmation records nothing.
    core::errors::Result<protocol::HistoryRecord> run(const std::string& query,
                                                      const protocol::Plan& plan,
                                                      const ConfirmFn& confirm);

    // Restores the snapshot of the most recent executed record that has one,
    // then deletes that snapshot.
    core::errors::Result<snapshot::RestoreReport> undo();

    core::errors::Result<std::size_t> cleanup(std::size_t keep_newest, int older_than_days);

    core::errors::Result<std::vector<protocol::HistoryRecord>> history(std::size_t limit) const;
    core::errors::Result<std::optional<protocol::HistoryRecord>> last_record() const;
    core::errors::Result<std::vector<snapshot::Snapshot>> list_snapshots() const;

    // States visited by the latest run, in order.
    const std::vector<RunState>& trace() const { return trace_; }

    static bool is_confirmed(protocol::RiskLevel risk, const std::string& answer);
    static std::string confirmation_prompt(protocol::RiskLevel risk);
    static std::string to_string(RunState state);

private:
    void transition(RunState next);
    protocol::HistoryRecord new_record(const std::string& query, const protocol::Plan& plan,
                                       const policy::PlanVerdict& verdict) const;
    core::errors::Result<std::optional<std::string>> take_snapshot(const protocol::Plan& plan);
    std::vector<protocol::ExecutionResult> execute_plan(const protocol::Plan& plan);
    void prune_if_needed();

    policy::PlanValidator validator_;
    exec::Executor& executor_;
    snapshot::SnapshotStore& snapshots_;
    HistoryLog& history_;
    OrchestratorOptions options_;
    std::string run_id_;
    std::vector<RunState> trace_;
};

}  // namespace drift::session
