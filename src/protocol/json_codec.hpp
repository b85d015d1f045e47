#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/drift_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/plan_contract.hpp"

namespace drift::protocol {

nlohmann::json to_json(const Plan& plan);
nlohmann::json to_json(const ExecutionResult& result);
nlohmann::json to_json(const HistoryRecord& record);

core::errors::Result<Plan> plan_from_json(const nlohmann::json& payload);
core::errors::Result<HistoryRecord> record_from_json(const nlohmann::json& payload);

// Parses the plan generator's raw JSON text.
core::errors::Result<Plan> parse_plan(const std::string& text);

}  // namespace drift::protocol
