#pragma once

#include <memory>
#include <regex>
#include <string>
#include <vector>
#include "core/errors/drift_errors.hpp"
#include "protocol/plan_contract.hpp"

namespace drift::policy {

// One row of the policy table. Patterns are ECMAScript regexes, matched
// case-sensitively anywhere in the whitespace-normalized command text.
struct RuleSpec {
    std::string id;
    std::string pattern;
    protocol::RiskLevel severity;
    std::string description;
};

struct Rule {
    std::string id;
    std::string pattern;
    protocol::RiskLevel severity;
    std::string description;
    std::regex compiled;
};

class RuleSet {
    struct Token {
        explicit Token() = default;
    };

public:
    explicit RuleSet(Token) {}

    // Compiles the specs; fails with invalid_rule on a bad pattern or a LOW
    // severity (LOW is the absence of a match, not a rule).
    static core::errors::Result<std::shared_ptr<const RuleSet>> compile(
        const std::vector<RuleSpec>& specs);

    // Rules of one tier, in declaration order.
    const std::vector<Rule>& tier(protocol::RiskLevel severity) const;

    std::size_t size() const;

private:
    std::vector<Rule> blocked_;
    std::vector<Rule> high_;
    std::vector<Rule> medium_;
    std::vector<Rule> empty_;
};

std::vector<RuleSpec> default_rule_specs();

// Built once from default_rule_specs(); shared by every classifier.
std::shared_ptr<const RuleSet> default_rule_set();

}  // namespace drift::policy
