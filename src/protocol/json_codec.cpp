#include "protocol/json_codec.hpp"

#include <utility>

namespace drift::protocol {

using core::errors::DriftError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

DriftError invalid_plan(const std::string& message) {
    return DriftError{ErrorCategory::Input, message, "invalid_plan",
                      "Expected {\"summary\", \"risk\", \"commands\": [{\"command\", ...}]}."};
}

DriftError invalid_record(const std::string& message) {
    return DriftError{ErrorCategory::Internal, message, "invalid_history_record"};
}

json command_to_json(const Command& command) {
    json payload;
    payload["command"] = command.command;
    payload["description"] = command.description;
    payload["dry_run"] = command.dry_run.has_value() ? json(command.dry_run.value())
                                                     : json(nullptr);
    return payload;
}

}  // namespace

json to_json(const Plan& plan) {
    json payload;
    payload["summary"] = plan.summary;
    payload["risk"] = to_string(plan.risk);
    payload["explanation"] = plan.explanation;
    payload["independent"] = plan.independent;

    json commands = json::array();
    for (const auto& command : plan.commands) {
        commands.push_back(command_to_json(command));
    }
    payload["commands"] = commands;
    payload["affected_files"] = plan.affected_files;

    json questions = json::array();
    for (const auto& question : plan.clarification_needed) {
        questions.push_back({{"question", question.question},
                             {"options", question.options}});
    }
    payload["clarification_needed"] = questions;
    return payload;
}

json to_json(const ExecutionResult& result) {
    json payload;
    payload["command"] = result.command;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["exit_code"] = result.exit_code;
    payload["duration_ms"] = result.duration_ms;
    payload["simulated"] = result.simulated;
    payload["outcome"] = to_string(result.outcome);
    return payload;
}

json to_json(const HistoryRecord& record) {
    json payload;
    payload["timestamp"] = record.timestamp;
    payload["ts_unix_ms"] = record.ts_unix_ms;
    payload["query"] = record.query;
    payload["plan"] = to_json(record.plan);
    payload["status"] = to_string(record.status);
    payload["verdict"] = to_string(record.verdict);
    payload["blocked_rule"] = record.blocked_rule;

    json results = json::array();
    for (const auto& result : record.results) {
        results.push_back(to_json(result));
    }
    payload["results"] = results;
    payload["exit_code"] = record.exit_code;
    payload["snapshot_id"] = record.snapshot_id.has_value()
                                 ? json(record.snapshot_id.value())
                                 : json(nullptr);
    payload["backend"] = record.backend;
    return payload;
}

core::errors::Result<Plan> plan_from_json(const json& payload) {
    if (!payload.is_object()) {
        return invalid_plan("Plan must be a JSON object.");
    }

    Plan plan;
    try {
        plan.summary = payload.value("summary", std::string());
        plan.explanation = payload.value("explanation", std::string());
        plan.independent = payload.value("independent", false);

        const auto risk = parse_risk_level(payload.value("risk", std::string("low")));
        if (!risk.has_value() || risk.value() == RiskLevel::Blocked) {
            return invalid_plan("Plan risk must be one of low, medium, high.");
        }
        plan.risk = risk.value();

        if (payload.contains("commands") && !payload.at("commands").is_null()) {
            if (!payload.at("commands").is_array()) {
                return invalid_plan("Plan commands must be an array.");
            }
            for (const auto& item : payload.at("commands")) {
                Command command;
                command.command = item.at("command").get<std::string>();
                command.description = item.value("description", std::string());
                if (item.contains("dry_run") && item.at("dry_run").is_string()) {
                    command.dry_run = item.at("dry_run").get<std::string>();
                }
                if (command.command.empty()) {
                    return invalid_plan("Plan command text cannot be empty.");
                }
                plan.commands.push_back(std::move(command));
            }
        }

        if (payload.contains("affected_files") && payload.at("affected_files").is_array()) {
            plan.affected_files =
                payload.at("affected_files").get<std::vector<std::string>>();
        }

        if (payload.contains("clarification_needed") &&
            payload.at("clarification_needed").is_array()) {
            for (const auto& item : payload.at("clarification_needed")) {
                ClarificationQuestion question;
                question.question = item.at("question").get<std::string>();
                if (item.contains("options") && item.at("options").is_array()) {
                    question.options = item.at("options").get<std::vector<std::string>>();
                }
                plan.clarification_needed.push_back(std::move(question));
            }
        }
    } catch (const json::exception& e) {
        return invalid_plan(std::string("Malformed plan field: ") + e.what());
    }

    return plan;
}

core::errors::Result<HistoryRecord> record_from_json(const json& payload) {
    if (!payload.is_object()) {
        return invalid_record("History record must be a JSON object.");
    }

    HistoryRecord record;
    try {
        record.timestamp = payload.at("timestamp").get<std::string>();
        record.ts_unix_ms = payload.value("ts_unix_ms", static_cast<std::int64_t>(0));
        record.query = payload.value("query", std::string());

        auto plan = plan_from_json(payload.at("plan"));
        if (core::errors::is_error(plan)) {
            return invalid_record("History record carries an invalid plan: " +
                                  core::errors::get_error(plan).message);
        }
        record.plan = core::errors::get_value(plan);

        const auto status = parse_record_status(payload.at("status").get<std::string>());
        if (!status.has_value()) {
            return invalid_record("Unknown history record status.");
        }
        record.status = status.value();

        const auto verdict = parse_risk_level(payload.value("verdict", std::string("low")));
        if (!verdict.has_value()) {
            return invalid_record("Unknown history record verdict.");
        }
        record.verdict = verdict.value();
        record.blocked_rule = payload.value("blocked_rule", std::string());

        if (payload.contains("results") && payload.at("results").is_array()) {
            for (const auto& item : payload.at("results")) {
                ExecutionResult result;
                result.command = item.value("command", std::string());
                result.stdout_text = item.value("stdout", std::string());
                result.stderr_text = item.value("stderr", std::string());
                result.exit_code = item.value("exit_code", 0);
                result.duration_ms = item.value("duration_ms", 0.0);
                result.simulated = item.value("simulated", false);
                const auto outcome =
                    parse_execution_outcome(item.value("outcome", std::string("succeeded")));
                if (!outcome.has_value()) {
                    return invalid_record("Unknown execution outcome.");
                }
                result.outcome = outcome.value();
                record.results.push_back(std::move(result));
            }
        }

        record.exit_code = payload.value("exit_code", 0);
        if (payload.contains("snapshot_id") && payload.at("snapshot_id").is_string()) {
            record.snapshot_id = payload.at("snapshot_id").get<std::string>();
        }
        record.backend = payload.value("backend", std::string());
    } catch (const json::exception& e) {
        return invalid_record(std::string("Malformed history record: ") + e.what());
    }

    return record;
}

core::errors::Result<Plan> parse_plan(const std::string& text) {
    const json payload = json::parse(text, nullptr, false);
    if (payload.is_discarded()) {
        return invalid_plan("Plan is not valid JSON.");
    }
    return plan_from_json(payload);
}

}  // namespace drift::protocol
