#pragma once

#include <string>
#include <vector>
#include "exec/executor.hpp"

namespace drift::exec {

// Executes nothing. Every command is recorded and reported as a simulated
// success, which is what dry runs and tests use.
class MockExecutor : public Executor {
public:
    core::errors::Result<protocol::ExecutionResult> execute(
        const protocol::Command& command) override;

    std::string name() const override { return "mock"; }

    const std::vector<std::string>& executed() const { return executed_; }
    void clear() { executed_.clear(); }

private:
    std::vector<std::string> executed_;
};

}  // namespace drift::exec
