#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "policy/command_classifier.hpp"
#include "protocol/plan_contract.hpp"

namespace drift::policy {

struct PlanVerdict {
    protocol::RiskLevel overall = protocol::RiskLevel::Low;
    std::vector<CommandVerdict> per_command;
    std::optional<std::size_t> blocked_index;  // First BLOCKED command
    bool understated = false;                  // Declared risk below computed

    bool blocked() const { return overall == protocol::RiskLevel::Blocked; }
};

class PlanValidator {
public:
    explicit PlanValidator(CommandClassifier classifier = CommandClassifier());

    PlanVerdict validate(const protocol::Plan& plan) const;

    const CommandClassifier& classifier() const { return classifier_; }

private:
    CommandClassifier classifier_;
};

}  // namespace drift::policy
