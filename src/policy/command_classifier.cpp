#include "policy/command_classifier.hpp"

#include <string>
#include <utility>
#include <vector>
#include "core/shell/shell_words.hpp"

namespace drift::policy {

using protocol::RiskLevel;

namespace {

constexpr RiskLevel kTierOrder[] = {RiskLevel::Blocked, RiskLevel::High, RiskLevel::Medium};

std::string join_words(const std::vector<std::string>& words) {
    std::string joined;
    for (const auto& word : words) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += word;
    }
    return joined;
}

void add_candidate(std::vector<std::string>& candidates, std::string text) {
    if (text.empty()) {
        return;
    }
    for (const auto& existing : candidates) {
        if (existing == text) {
            return;
        }
    }
    candidates.push_back(std::move(text));
}

}  // namespace

CommandClassifier::CommandClassifier(std::shared_ptr<const RuleSet> rules)
    : rules_(std::move(rules)) {}

CommandVerdict CommandClassifier::classify_fragment(const std::string& fragment) const {
    for (const RiskLevel tier : kTierOrder) {
        for (const auto& rule : rules_->tier(tier)) {
            if (!std::regex_search(fragment, rule.compiled)) {
                continue;
            }
            return CommandVerdict{rule.severity, rule.id, rule.description, fragment};
        }
    }
    return CommandVerdict{RiskLevel::Low, "", "", fragment};
}

CommandVerdict CommandClassifier::classify(const std::string& command) const {
    // std::regex recurses per character; long input would exhaust the stack.
    if (command.size() > kMaxCommandLength) {
        return CommandVerdict{RiskLevel::Blocked, "command-too-long",
                              "Command longer than " + std::to_string(kMaxCommandLength) +
                                  " bytes cannot be checked",
                              command.substr(0, 80)};
    }

    std::vector<std::string> candidates;
    // The whole command catches patterns that span a pipe (curl ... | sh).
    add_candidate(candidates, core::shell::normalize_whitespace(command));

    // Unbalanced quotes leave only the whole-string candidate.
    const auto segments = core::shell::split_compound(command);
    if (segments.has_value()) {
        for (const auto& segment : segments.value()) {
            add_candidate(candidates, core::shell::normalize_whitespace(segment));
            const auto words = core::shell::split_words(segment);
            if (words.has_value()) {
                add_candidate(candidates, join_words(words.value()));
            }
        }
    }

    CommandVerdict verdict;
    for (const auto& candidate : candidates) {
        CommandVerdict current = classify_fragment(candidate);
        if (current.risk == RiskLevel::Blocked) {
            return current;
        }
        if (static_cast<int>(current.risk) > static_cast<int>(verdict.risk)) {
            verdict = std::move(current);
        }
    }
    return verdict;
}

}  // namespace drift::policy
