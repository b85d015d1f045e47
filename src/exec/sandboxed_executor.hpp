#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "exec/executor.hpp"
#include "policy/path_guard.hpp"

namespace drift::exec {

struct SandboxOptions {
    std::filesystem::path root;
    std::uint32_t timeout_ms = 300000;
};

// Local execution confined to a root directory. Commands run with the root
// as working directory; any write target, redirect or cd that resolves
// outside it is refused before the process starts (exit 126, rejected).
class SandboxedExecutor : public Executor {
public:
    explicit SandboxedExecutor(SandboxOptions options);

    core::errors::Result<protocol::ExecutionResult> execute(
        const protocol::Command& command) override;

    std::string name() const override { return "sandbox"; }

    // Describes the first escaping target, or nullopt when the command stays
    // inside the root.
    std::optional<std::string> find_violation(const std::string& command) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::uint32_t timeout_ms_;
    policy::PathGuard guard_;
};

}  // namespace drift::exec
