#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "policy/path_guard.hpp"
#include "protocol/plan_contract.hpp"

namespace drift::snapshot {

// Operands a command would write or delete: arguments of file-mutating
// programs (mv, cp, rm, touch, ...), output options (cp -t, dd of=, curl -o,
// wget -O, tar -C, unzip -d) and redirection targets. Relative to the
// command's own working directory, unresolved.
std::vector<std::string> mutated_operands(const std::string& command);

// Absolute snapshot set for a plan: the declared affected files resolved
// against base, followed by inferred operands that stay inside the guard's
// roots. Duplicates are dropped.
std::vector<std::filesystem::path> collect_snapshot_paths(
    const protocol::Plan& plan, const std::filesystem::path& base,
    const policy::PathGuard& guard);

}  // namespace drift::snapshot
