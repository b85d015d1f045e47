#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "exec/executor.hpp"

namespace drift::exec {

struct ContainerOptions {
    std::string runtime = "docker";
    std::string image = "ubuntu:latest";
    std::filesystem::path mount_root;   // Bind-mounted at /work
    std::uint32_t timeout_ms = 300000;
};

// Runs each command in a throwaway container with only mount_root visible.
class ContainerExecutor : public Executor {
public:
    explicit ContainerExecutor(ContainerOptions options);

    core::errors::Result<protocol::ExecutionResult> execute(
        const protocol::Command& command) override;

    std::string name() const override { return "docker"; }

    // <runtime> run --rm --name <name> -v <root>:/work -w /work <image> sh -c <command>
    std::vector<std::string> container_argv(const std::string& container_name,
                                            const std::string& command) const;

    const ContainerOptions& options() const { return options_; }

private:
    ContainerOptions options_;
};

}  // namespace drift::exec
