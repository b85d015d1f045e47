#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace drift::app::cli {

    using namespace drift::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> plan_file;
        std::optional<std::string> query;
        std::optional<std::string> cwd;
        std::optional<std::string> limit;
        std::optional<std::string> keep;
        std::optional<std::string> days;
        bool verbose = false;
    };

    namespace {

        std::optional<CliCommand> parse_command(const std::string& name) {
            static const std::unordered_map<std::string, CliCommand> kCommands = {
                {"validate", CliCommand::Validate}, {"run", CliCommand::Run},
                {"undo", CliCommand::Undo},         {"history", CliCommand::History},
                {"snapshots", CliCommand::Snapshots}, {"cleanup", CliCommand::Cleanup}};
            const auto it = kCommands.find(name);
            if (it == kCommands.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        // Flags each subcommand accepts besides --verbose.
        bool accepts(const CliCommand command, const std::string& flag) {
            switch (command) {
                case CliCommand::Validate:
                    return flag == "--plan-file";
                case CliCommand::Run:
                    return flag == "--plan-file" || flag == "--query" || flag == "--cwd";
                case CliCommand::History:
                    return flag == "--limit";
                case CliCommand::Cleanup:
                    return flag == "--keep" || flag == "--days";
                default:
                    return false;
            }
        }

        // Exception-free integer parsing
        template <typename T>
        Result<T> parse_number(const std::string& flag, const std::string& text) {
            T value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return DriftError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            return value;
        }

    } // namespace

    std::string usage() {
        return "Usage: drift <command> [options]\n"
               "  validate --plan-file F           classify a plan without running it\n"
               "  run --plan-file F [--query Q] [--cwd D]\n"
               "  undo                             restore the last run's snapshot\n"
               "  history [--limit N]\n"
               "  snapshots\n"
               "  cleanup [--keep N] [--days D]\n"
               "Global: --verbose";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return DriftError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        const std::string name = argv[1];
        const auto command = parse_command(name);
        if (!command.has_value()) {
            return DriftError{ErrorCategory::Input, "Unknown command: " + name, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the subcommand
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::unordered_map<std::string, std::optional<std::string>*> valued = {
            {"--plan-file", &raw.plan_file}, {"--query", &raw.query}, {"--cwd", &raw.cwd},
            {"--limit", &raw.limit},         {"--keep", &raw.keep},   {"--days", &raw.days}};
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }
            const auto slot = valued.find(args[i]);
            if (slot == valued.end()) {
                return DriftError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
            if (!accepts(command.value(), args[i])) {
                return DriftError{ErrorCategory::Input, args[i] + " is not valid for '" + name + "'", "unknown_argument", usage()};
            }
            if (i + 1 >= args.size()) {
                return DriftError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            *slot->second = args[++i];
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliRequest req;
        req.command = command.value();
        req.verbose = raw.verbose;

        if (req.command == CliCommand::Validate || req.command == CliCommand::Run) {
            if (!raw.plan_file.has_value()) {
                return DriftError{ErrorCategory::Input, "Must provide --plan-file", "missing_required_flag"};
            }
            std::error_code file_ec;
            const std::filesystem::path plan_path(raw.plan_file.value());
            if (!std::filesystem::is_regular_file(plan_path, file_ec) || file_ec) {
                return DriftError{ErrorCategory::Input, "Plan file does not exist: " + plan_path.string(), "invalid_path"};
            }
            req.plan_file = plan_path;
        }
        if (raw.query) req.query = raw.query.value();

        if (raw.limit) {
            auto limit = parse_number<std::size_t>("--limit", raw.limit.value());
            if (is_error(limit)) return get_error(limit);
            if (get_value(limit) == 0) {
                return DriftError{ErrorCategory::Input, "--limit out of bounds", "bounds_error", "Must be at least 1."};
            }
            req.limit = get_value(limit);
        }
        if (raw.keep) {
            auto keep = parse_number<std::size_t>("--keep", raw.keep.value());
            if (is_error(keep)) return get_error(keep);
            req.keep = get_value(keep);
        }
        if (raw.days) {
            auto days = parse_number<int>("--days", raw.days.value());
            if (is_error(days)) return get_error(days);
            if (get_value(days) < 0) {
                return DriftError{ErrorCategory::Input, "--days out of bounds", "bounds_error", "Must not be negative."};
            }
            req.days = get_value(days);
        }

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return DriftError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }
            req.working_directory = std::move(p);
        }

        std::error_code canonical_ec;
        std::filesystem::path canonical_path = std::filesystem::canonical(req.working_directory, canonical_ec);
        if (canonical_ec) {
            return DriftError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
        }
        req.working_directory = std::move(canonical_path);

        return req;
    }

} // namespace drift::app::cli
