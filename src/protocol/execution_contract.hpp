#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol/plan_contract.hpp"

namespace drift::protocol {

enum class ExecutionOutcome {
    Succeeded,
    Failed,
    TimedOut,
    Rejected,
    Skipped
};

struct ExecutionResult {
    std::string command;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    double duration_ms = 0.0;
    bool simulated = false;
    ExecutionOutcome outcome = ExecutionOutcome::Succeeded;
};

enum class RecordStatus {
    Executed,
    Blocked,
    DryRun
};

struct HistoryRecord {
    std::string timestamp;           // ISO-8601, local time
    std::int64_t ts_unix_ms = 0;
    std::string query;
    Plan plan;
    RecordStatus status = RecordStatus::Executed;
    RiskLevel verdict = RiskLevel::Low;
    std::string blocked_rule;
    std::vector<ExecutionResult> results;
    int exit_code = 0;
    std::optional<std::string> snapshot_id;
    std::string backend;
};

inline std::string to_string(const ExecutionOutcome outcome) {
    switch (outcome) {
        case ExecutionOutcome::Succeeded:
            return "succeeded";
        case ExecutionOutcome::Failed:
            return "failed";
        case ExecutionOutcome::TimedOut:
            return "timed_out";
        case ExecutionOutcome::Rejected:
            return "rejected";
        case ExecutionOutcome::Skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

inline std::string to_string(const RecordStatus status) {
    switch (status) {
        case RecordStatus::Executed:
            return "executed";
        case RecordStatus::Blocked:
            return "blocked";
        case RecordStatus::DryRun:
            return "dry_run";
        default:
            return "unknown";
    }
}

inline std::optional<ExecutionOutcome> parse_execution_outcome(const std::string& text) {
    if (text == "succeeded") return ExecutionOutcome::Succeeded;
    if (text == "failed") return ExecutionOutcome::Failed;
    if (text == "timed_out") return ExecutionOutcome::TimedOut;
    if (text == "rejected") return ExecutionOutcome::Rejected;
    if (text == "skipped") return ExecutionOutcome::Skipped;
    return std::nullopt;
}

inline std::optional<RecordStatus> parse_record_status(const std::string& text) {
    if (text == "executed") return RecordStatus::Executed;
    if (text == "blocked") return RecordStatus::Blocked;
    if (text == "dry_run") return RecordStatus::DryRun;
    return std::nullopt;
}

}  // namespace drift::protocol
