#pragma once
#include <optional>
#include <string>
#include <vector>

namespace drift::protocol {

    // Ordered by severity so std::max picks the most severe tier.
    enum class RiskLevel {
        Low = 0,
        Medium = 1,
        High = 2,
        Blocked = 3
    };

    // A single shell invocation proposed by the plan generator.
    struct Command {
        std::string command;
        std::string description;
        std::optional<std::string> dry_run;  // Non-mutating preview form
    };

    struct ClarificationQuestion {
        std::string question;
        std::vector<std::string> options;
    };

    // The unit the orchestrator consumes. Immutable once validation begins.
    struct Plan {
        std::string summary;
        RiskLevel risk = RiskLevel::Low;     // Declared by the generator, not trusted
        std::vector<Command> commands;
        std::string explanation;
        std::vector<std::string> affected_files;
        std::vector<ClarificationQuestion> clarification_needed;
        bool independent = false;            // Keep going after a failing command

        bool needs_clarification() const { return !clarification_needed.empty(); }
    };

    inline std::string to_string(const RiskLevel level) {
        switch (level) {
            case RiskLevel::Low:
                return "low";
            case RiskLevel::Medium:
                return "medium";
            case RiskLevel::High:
                return "high";
            case RiskLevel::Blocked:
                return "blocked";
            default:
                return "unknown";
        }
    }

    inline std::optional<RiskLevel> parse_risk_level(const std::string& text) {
        if (text == "low") return RiskLevel::Low;
        if (text == "medium") return RiskLevel::Medium;
        if (text == "high") return RiskLevel::High;
        if (text == "blocked") return RiskLevel::Blocked;
        return std::nullopt;
    }

} // namespace drift::protocol
