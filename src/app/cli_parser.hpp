#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/drift_errors.hpp"

namespace drift::app::cli {

    enum class CliCommand {
        Validate,
        Run,
        Undo,
        History,
        Snapshots,
        Cleanup
    };

    struct CliRequest {
        CliCommand command = CliCommand::Run;
        std::optional<std::filesystem::path> plan_file;
        std::string query;
        std::filesystem::path working_directory = ".";
        std::size_t limit = 10;
        std::optional<std::size_t> keep;   // Config default when unset
        std::optional<int> days;
        bool verbose = false;
    };

    drift::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();

} // namespace drift::app::cli
