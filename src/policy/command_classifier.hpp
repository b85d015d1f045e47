#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "policy/rule_set.hpp"
#include "protocol/plan_contract.hpp"

namespace drift::policy {

// Longer commands are BLOCKED (rule command-too-long) without pattern matching.
inline constexpr std::size_t kMaxCommandLength = 8192;

struct CommandVerdict {
    protocol::RiskLevel risk = protocol::RiskLevel::Low;
    std::string rule_id;        // Empty when nothing matched
    std::string description;
    std::string matched_text;   // Sub-command (or whole command) that matched
};

// Pure classifier over a RuleSet. Tiers are evaluated most severe first and
// the first BLOCKED match is terminal.
class CommandClassifier {
public:
    explicit CommandClassifier(std::shared_ptr<const RuleSet> rules = default_rule_set());

    CommandVerdict classify(const std::string& command) const;

private:
    CommandVerdict classify_fragment(const std::string& fragment) const;

    std::shared_ptr<const RuleSet> rules_;
};

}  // namespace drift::policy
