#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/drift_errors.hpp"
#include "protocol/json_codec.hpp"

namespace {

using drift::core::errors::get_error;
using drift::core::errors::get_value;
using drift::core::errors::is_error;
using drift::protocol::parse_plan;
using drift::protocol::RiskLevel;

TEST(JsonCodecTest, ParsesFullPlan) {
    const std::string text = R"({
        "summary": "Rename notes",
        "risk": "medium",
        "commands": [
            {"command": "mv a.txt b.txt", "description": "rename", "dry_run": "ls a.txt"}
        ],
        "explanation": "Moves the file.",
        "affected_files": ["a.txt", "b.txt"],
        "independent": true
    })";

    auto parsed = parse_plan(text);
    ASSERT_FALSE(is_error(parsed));
    const auto& plan = get_value(parsed);
    EXPECT_EQ(plan.summary, "Rename notes");
    EXPECT_EQ(plan.risk, RiskLevel::Medium);
    ASSERT_EQ(plan.commands.size(), 1u);
    EXPECT_EQ(plan.commands[0].command, "mv a.txt b.txt");
    EXPECT_EQ(plan.commands[0].dry_run.value(), "ls a.txt");
    EXPECT_EQ(plan.affected_files.size(), 2u);
    EXPECT_TRUE(plan.independent);
    EXPECT_FALSE(plan.needs_clarification());
}

TEST(JsonCodecTest, ParsesClarificationRequest) {
    auto parsed = parse_plan(R"({
        "summary": "Unclear",
        "risk": "low",
        "commands": [],
        "clarification_needed": [{"question": "Which directory?", "options": ["src", "docs"]}]
    })");
    ASSERT_FALSE(is_error(parsed));
    const auto& plan = get_value(parsed);
    ASSERT_TRUE(plan.needs_clarification());
    EXPECT_EQ(plan.clarification_needed[0].options.size(), 2u);
}

TEST(JsonCodecTest, RejectsInvalidJson) {
    auto parsed = parse_plan("{not json");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_plan");
}

TEST(JsonCodecTest, RejectsDeclaredBlockedRisk) {
    auto parsed = parse_plan(R"({"summary": "x", "risk": "blocked", "commands": []})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_plan");
}

TEST(JsonCodecTest, RejectsMissingOrEmptyCommandText) {
    auto missing = parse_plan(R"({"summary": "x", "commands": [{"description": "d"}]})");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_plan");

    auto empty = parse_plan(R"({"summary": "x", "commands": [{"command": ""}]})");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "invalid_plan");
}

TEST(JsonCodecTest, HistoryRecordSurvivesSerialization) {
    drift::protocol::HistoryRecord record;
    record.timestamp = "2024-05-01T13:37:00.000";
    record.query = "rename";
    record.plan.summary = "Rename";
    record.plan.commands.push_back({"mv a b", "", std::nullopt});
    record.status = drift::protocol::RecordStatus::Executed;
    record.verdict = RiskLevel::Medium;
    record.exit_code = 1;
    drift::protocol::ExecutionResult result;
    result.command = "mv a b";
    result.exit_code = 1;
    result.outcome = drift::protocol::ExecutionOutcome::Failed;
    record.results.push_back(result);

    auto loaded = drift::protocol::record_from_json(drift::protocol::to_json(record));
    ASSERT_FALSE(is_error(loaded));
    const auto& value = get_value(loaded);
    EXPECT_EQ(value.verdict, RiskLevel::Medium);
    EXPECT_EQ(value.results.at(0).outcome, drift::protocol::ExecutionOutcome::Failed);
    EXPECT_FALSE(value.snapshot_id.has_value());
}

TEST(JsonCodecTest, RejectsRecordWithoutStatus) {
    nlohmann::json payload = {{"timestamp", "t"}, {"plan", {{"summary", "x"}}}};
    auto loaded = drift::protocol::record_from_json(payload);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_history_record");
}

}  // namespace
