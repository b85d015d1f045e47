#include "policy/plan_validator.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace drift::policy {

using protocol::RiskLevel;

PlanValidator::PlanValidator(CommandClassifier classifier)
    : classifier_(std::move(classifier)) {}

PlanVerdict PlanValidator::validate(const protocol::Plan& plan) const {
    PlanVerdict verdict;
    verdict.per_command.reserve(plan.commands.size());

    for (std::size_t i = 0; i < plan.commands.size(); ++i) {
        CommandVerdict command_verdict = classifier_.classify(plan.commands[i].command);
        if (command_verdict.risk == RiskLevel::Blocked) {
            if (!verdict.blocked_index.has_value()) {
                verdict.blocked_index = i;
            }
            DRIFT_LOG_WARN("PlanValidator: command #" + std::to_string(i + 1) +
                           " blocked by rule " + command_verdict.rule_id);
        }
        if (static_cast<int>(command_verdict.risk) > static_cast<int>(verdict.overall)) {
            verdict.overall = command_verdict.risk;
        }
        verdict.per_command.push_back(std::move(command_verdict));
    }

    if (!verdict.blocked() &&
        static_cast<int>(plan.risk) < static_cast<int>(verdict.overall)) {
        verdict.understated = true;
        DRIFT_LOG_WARN("PlanValidator: plan declared risk " + protocol::to_string(plan.risk) +
                       " but commands classify as " + protocol::to_string(verdict.overall));
    }
    return verdict;
}

}  // namespace drift::policy
