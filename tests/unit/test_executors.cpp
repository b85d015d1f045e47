#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/drift_config.hpp"
#include "core/config/id_generator.hpp"
#include "core/errors/drift_errors.hpp"
#include "exec/container_executor.hpp"
#include "exec/executor_factory.hpp"
#include "exec/local_executor.hpp"
#include "exec/mock_executor.hpp"
#include "exec/process_runner.hpp"
#include "exec/sandboxed_executor.hpp"

namespace {

using drift::core::errors::get_error;
using drift::core::errors::get_value;
using drift::core::errors::is_error;
using drift::exec::ContainerExecutor;
using drift::exec::ContainerOptions;
using drift::exec::LocalExecutor;
using drift::exec::LocalOptions;
using drift::exec::MockExecutor;
using drift::exec::SandboxedExecutor;
using drift::exec::SandboxOptions;
using drift::protocol::Command;
using drift::protocol::ExecutionOutcome;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_executors_" + drift::core::config::generate_run_id());
        std::filesystem::create_directories(root_ / "sandbox");
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path sandbox() const { return root_ / "sandbox"; }

private:
    std::filesystem::path root_;
};

Command make_command(const std::string& text) {
    return Command{text, "", std::nullopt};
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

TEST(MockExecutorTest, RecordsWithoutRunning) {
    TempWorkspace workspace;
    const auto marker = workspace.root() / "marker.txt";

    MockExecutor executor;
    auto result = executor.execute(make_command("touch " + marker.string()));
    ASSERT_FALSE(is_error(result));

    const auto& value = get_value(result);
    EXPECT_TRUE(value.simulated);
    EXPECT_EQ(value.exit_code, 0);
    EXPECT_EQ(value.outcome, ExecutionOutcome::Succeeded);
    EXPECT_EQ(value.stdout_text, "[MOCK] Would execute: touch " + marker.string() + "\n");
    ASSERT_EQ(executor.executed().size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(marker));
    EXPECT_EQ(executor.name(), "mock");
}

TEST(ProcessRunnerTest, PlainCommandsUseArgv) {
    auto argv = drift::exec::command_argv("echo 'hello world' done");
    ASSERT_FALSE(is_error(argv));
    EXPECT_EQ(get_value(argv), (std::vector<std::string>{"echo", "hello world", "done"}));
}

TEST(ProcessRunnerTest, ShellSyntaxUsesShell) {
    auto argv = drift::exec::command_argv("ls | wc -l");
    ASSERT_FALSE(is_error(argv));
    EXPECT_EQ(get_value(argv), (std::vector<std::string>{"/bin/sh", "-c", "ls | wc -l"}));
}

TEST(ProcessRunnerTest, EmptyCommandIsAnError) {
    auto argv = drift::exec::command_argv("   ");
    ASSERT_TRUE(is_error(argv));
    EXPECT_EQ(get_error(argv).code, "execution_failure");
}

TEST(LocalExecutorTest, CapturesStdout) {
    TempWorkspace workspace;
    LocalExecutor executor(LocalOptions{workspace.root(), 10000});
    auto result = executor.execute(make_command("echo hello"));
    ASSERT_FALSE(is_error(result));

    const auto& value = get_value(result);
    EXPECT_EQ(value.stdout_text, "hello\n");
    EXPECT_EQ(value.exit_code, 0);
    EXPECT_EQ(value.outcome, ExecutionOutcome::Succeeded);
    EXPECT_FALSE(value.simulated);
    EXPECT_GE(value.duration_ms, 0.0);
}

TEST(LocalExecutorTest, RunsInWorkingDirectory) {
    TempWorkspace workspace;
    LocalExecutor executor(LocalOptions{workspace.root(), 10000});
    auto result = executor.execute(make_command("echo data > out.txt"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_EQ(read_file(workspace.root() / "out.txt"), "data\n");
}

TEST(LocalExecutorTest, ReportsNonZeroExit) {
    TempWorkspace workspace;
    LocalExecutor executor(LocalOptions{workspace.root(), 10000});
    auto result = executor.execute(make_command("sh -c 'echo oops >&2; exit 3'"));
    ASSERT_FALSE(is_error(result));

    const auto& value = get_value(result);
    EXPECT_EQ(value.exit_code, 3);
    EXPECT_EQ(value.outcome, ExecutionOutcome::Failed);
    EXPECT_EQ(value.stderr_text, "oops\n");
}

TEST(LocalExecutorTest, MissingProgramExits127) {
    TempWorkspace workspace;
    LocalExecutor executor(LocalOptions{workspace.root(), 10000});
    auto result = executor.execute(make_command("drift-no-such-program --flag"));
    ASSERT_FALSE(is_error(result));

    const auto& value = get_value(result);
    EXPECT_EQ(value.exit_code, drift::exec::kSpawnFailureExitCode);
    EXPECT_EQ(value.outcome, ExecutionOutcome::Failed);
    EXPECT_NE(value.stderr_text.find("drift-no-such-program"), std::string::npos);
}

TEST(LocalExecutorTest, TimeoutKillsProcessGroup) {
    TempWorkspace workspace;
    LocalExecutor executor(LocalOptions{workspace.root(), 200});
    auto result = executor.execute(make_command("sleep 5; echo late"));
    ASSERT_FALSE(is_error(result));

    const auto& value = get_value(result);
    EXPECT_EQ(value.outcome, ExecutionOutcome::TimedOut);
    EXPECT_EQ(value.exit_code, drift::exec::kTimeoutExitCode);
    EXPECT_EQ(value.stdout_text.find("late"), std::string::npos);
    EXPECT_LT(value.duration_ms, 4000.0);
}

TEST(LocalExecutorTest, TimeoutDoesNotWaitForDetachedDescendant) {
    TempWorkspace workspace;
    LocalExecutor executor(LocalOptions{workspace.root(), 500});
    auto result = executor.execute(make_command("setsid sleep 6 & sleep 30"));
    ASSERT_FALSE(is_error(result));

    const auto& value = get_value(result);
    EXPECT_EQ(value.outcome, ExecutionOutcome::TimedOut);
    EXPECT_EQ(value.exit_code, drift::exec::kTimeoutExitCode);
    EXPECT_LT(value.duration_ms, 4000.0);
}

TEST(SandboxedExecutorTest, RunsInsideRoot) {
    TempWorkspace workspace;
    SandboxedExecutor executor(SandboxOptions{workspace.sandbox(), 10000});
    auto result = executor.execute(make_command("touch inside.txt"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, ExecutionOutcome::Succeeded);
    EXPECT_TRUE(std::filesystem::exists(workspace.sandbox() / "inside.txt"));
}

TEST(SandboxedExecutorTest, RejectsEscapingWrite) {
    TempWorkspace workspace;
    SandboxedExecutor executor(SandboxOptions{workspace.sandbox(), 10000});
    auto result = executor.execute(make_command("touch ../escaped.txt"));
    ASSERT_FALSE(is_error(result));

    const auto& value = get_value(result);
    EXPECT_EQ(value.outcome, ExecutionOutcome::Rejected);
    EXPECT_EQ(value.exit_code, drift::exec::kRejectedExitCode);
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "escaped.txt"));
}

TEST(SandboxedExecutorTest, RejectsEscapingRedirectAndCd) {
    TempWorkspace workspace;
    SandboxedExecutor executor(SandboxOptions{workspace.sandbox(), 10000});
    const auto outside = workspace.root() / "out.txt";
    EXPECT_TRUE(executor.find_violation("echo hi > " + outside.string()).has_value());
    EXPECT_TRUE(executor.find_violation("cd / && rm -f etc-copy").has_value());
    EXPECT_TRUE(executor.find_violation("rm -f $TARGET").has_value());
    EXPECT_FALSE(executor.find_violation("mkdir -p a/b && touch a/b/c").has_value());
    EXPECT_FALSE(executor.find_violation("cat /etc/hostname").has_value());
}

TEST(SandboxedExecutorTest, RejectsEscapingOutputOptions) {
    TempWorkspace workspace;
    SandboxedExecutor executor(SandboxOptions{workspace.sandbox(), 10000});
    const std::string outside = workspace.root().string();
    const std::vector<std::string> escaping = {
        "cp a.txt --target-directory=" + outside,
        "cp -t " + outside + " a.txt",
        "dd if=a.txt of=" + outside + "/a.img",
        "curl -sSLo " + outside + "/page.html https://example.com",
        "wget -O " + outside + "/f.tgz https://example.com/f.tgz",
        "tar -xzf a.tgz -C " + outside,
        "tar -czf " + outside + "/b.tgz data",
        "unzip a.zip -d " + outside,
    };
    for (const auto& command : escaping) {
        EXPECT_TRUE(executor.find_violation(command).has_value()) << command;
    }

    EXPECT_FALSE(executor.find_violation("curl -sSLo page.html https://example.com").has_value());
    EXPECT_FALSE(executor.find_violation("tar -xzf " + outside + "/a.tgz -C data").has_value());
}

TEST(SandboxedExecutorTest, TargetDirectoryEscapeWritesNothing) {
    TempWorkspace workspace;
    {
        std::ofstream out(workspace.sandbox() / "a.txt");
        out << "inside";
    }
    SandboxedExecutor executor(SandboxOptions{workspace.sandbox(), 10000});
    auto result = executor.execute(
        make_command("cp a.txt --target-directory=" + workspace.root().string()));
    ASSERT_FALSE(is_error(result));

    const auto& value = get_value(result);
    EXPECT_EQ(value.outcome, ExecutionOutcome::Rejected);
    EXPECT_EQ(value.exit_code, drift::exec::kRejectedExitCode);
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "a.txt"));
    EXPECT_EQ(read_file(workspace.sandbox() / "a.txt"), "inside");
}

TEST(SandboxedExecutorTest, RejectsSymlinkEscape) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "elsewhere");
    std::filesystem::create_directory_symlink(workspace.root() / "elsewhere",
                                              workspace.sandbox() / "link");
    SandboxedExecutor executor(SandboxOptions{workspace.sandbox(), 10000});
    EXPECT_TRUE(executor.find_violation("touch link/file.txt").has_value());
}

TEST(ContainerExecutorTest, BuildsRuntimeArgv) {
    ContainerOptions options;
    options.runtime = "podman";
    options.image = "alpine:3";
    options.mount_root = "/work/project";
    ContainerExecutor executor(options);

    const auto argv = executor.container_argv("drift-abc", "ls -la | head");
    EXPECT_EQ(argv, (std::vector<std::string>{"podman", "run", "--rm", "--name", "drift-abc",
                                               "-v", "/work/project:/work", "-w", "/work",
                                               "alpine:3", "sh", "-c", "ls -la | head"}));
    EXPECT_EQ(executor.name(), "docker");
}

TEST(ExecutorFactoryTest, BuildsConfiguredBackend) {
    TempWorkspace workspace;
    drift::core::config::DriftConfig config;

    config.executor_mode = drift::core::config::ExecutorMode::Mock;
    auto mock = drift::exec::make_executor(config, workspace.root());
    ASSERT_FALSE(is_error(mock));
    EXPECT_EQ(get_value(mock)->name(), "mock");

    config.executor_mode = drift::core::config::ExecutorMode::Local;
    auto local = drift::exec::make_executor(config, workspace.root());
    ASSERT_FALSE(is_error(local));
    EXPECT_EQ(get_value(local)->name(), "local");

    config.sandbox_root = workspace.sandbox();
    auto confined = drift::exec::make_executor(config, workspace.root());
    ASSERT_FALSE(is_error(confined));
    EXPECT_EQ(get_value(confined)->name(), "sandbox");
}

TEST(ExecutorFactoryTest, SandboxNeedsExistingRoot) {
    TempWorkspace workspace;
    drift::core::config::DriftConfig config;
    config.executor_mode = drift::core::config::ExecutorMode::Sandbox;

    auto unset = drift::exec::make_executor(config, workspace.root());
    ASSERT_TRUE(is_error(unset));
    EXPECT_EQ(get_error(unset).code, "invalid_config");

    config.sandbox_root = workspace.root() / "missing";
    auto missing = drift::exec::make_executor(config, workspace.root());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_config");
}

}  // namespace
