#pragma once

#include <string>
#include "core/errors/drift_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/plan_contract.hpp"

namespace drift::exec {

// Runs one command and reports what happened. A command that runs and fails
// is a value with a non-zero exit code; an error is returned only when the
// backend itself could not do its job.
class Executor {
public:
    virtual ~Executor() = default;

    virtual core::errors::Result<protocol::ExecutionResult> execute(
        const protocol::Command& command) = 0;

    // Backend label stored with each history record.
    virtual std::string name() const = 0;
};

}  // namespace drift::exec
