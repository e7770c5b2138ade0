#include <gtest/gtest.h>

#include <filesystem>

#include "executor/code_executor.hpp"
#include "test_support.hpp"
#include "utils/common.hpp"
#include "utils/temp_dir.hpp"

namespace pyexec::executor {
namespace {

using pyexec::service::ErrorKind;

class CodeExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto python = pyexec::test_support::FindPython3();
        if (python.empty()) {
            GTEST_SKIP() << "python3 is not installed";
        }
        std::filesystem::create_directories(env_.Path() / "bin");
        std::filesystem::create_symlink(python, env_.Path() / "bin" / "python");
        config_.timeouts.execution_s = 5;
    }

    pyexec::utils::ScopedTempDir env_{"pyexec_executor_env_"};
    pyexec::config::Config config_;
};

TEST_F(CodeExecutorTest, HelloWorld) {
    CodeExecutor executor(config_);

    const auto result = executor.Execute(env_.Path(), "print('Hello, World!')");

    EXPECT_EQ(result.output, "Hello, World!\n");
    EXPECT_EQ(result.error, "");
    EXPECT_EQ(result.kind, ErrorKind::kNone);
}

TEST_F(CodeExecutorTest, MultiLineProgram) {
    CodeExecutor executor(config_);

    const auto result = executor.Execute(env_.Path(), "result = sum(range(1, 11))\nprint(f'Sum: {result}')");

    EXPECT_EQ(result.output, "Sum: 55\n");
    EXPECT_EQ(result.error, "");
}

TEST_F(CodeExecutorTest, UncaughtExceptionForwardsTraceback) {
    CodeExecutor executor(config_);

    const auto result = executor.Execute(env_.Path(), "raise ValueError('This is a test error')");

    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.kind, ErrorKind::kNonZeroExit);
    EXPECT_NE(result.error.find("Traceback (most recent call last):"), std::string::npos);
    EXPECT_NE(result.error.find("ValueError: This is a test error"), std::string::npos);
}

TEST_F(CodeExecutorTest, KeepsOutputProducedBeforeFailure) {
    CodeExecutor executor(config_);

    const auto result = executor.Execute(
        env_.Path(), "import sys\nprint('partial')\nsys.stdout.flush()\nraise RuntimeError('late')");

    EXPECT_EQ(result.output, "partial\n");
    EXPECT_NE(result.error.find("RuntimeError: late"), std::string::npos);
}

TEST_F(CodeExecutorTest, SilentNonZeroExitGetsDiagnostic) {
    CodeExecutor executor(config_);

    const auto result = executor.Execute(env_.Path(), "import sys\nsys.exit(4)");

    EXPECT_EQ(result.kind, ErrorKind::kNonZeroExit);
    EXPECT_EQ(result.error, "Error: process exited with code 4");
}

TEST_F(CodeExecutorTest, TimeoutKillsInterpreter) {
    config_.timeouts.execution_s = 1;
    CodeExecutor executor(config_);
    pyexec::utils::ScopedTempDir scratch("pyexec_executor_pid_");
    const auto pid_file = scratch.Path() / "pid";

    const auto result = executor.Execute(
        env_.Path(),
        "import os, sys, time\n"
        "open('" + pid_file.string() + "', 'w').write(str(os.getpid()))\n"
        "print('started')\n"
        "sys.stdout.flush()\n"
        "time.sleep(30)\n");

    EXPECT_EQ(result.kind, ErrorKind::kExecutionTimeout);
    EXPECT_EQ(result.error, "Error: Code execution timed out (1 seconds limit)");
    EXPECT_EQ(result.output, "started\n");

    const auto pid_text = pyexec::utils::Trim(pyexec::test_support::ReadFile(pid_file));
    ASSERT_FALSE(pid_text.empty());
    EXPECT_FALSE(pyexec::test_support::ProcessAlive(static_cast<pid_t>(std::stol(pid_text))));
}

TEST_F(CodeExecutorTest, UnflushedOutputSurvivesTimeout) {
    config_.timeouts.execution_s = 1;
    CodeExecutor executor(config_);

    const auto result = executor.Execute(env_.Path(), "import time\nprint('partial')\ntime.sleep(30)\n");

    EXPECT_EQ(result.kind, ErrorKind::kExecutionTimeout);
    EXPECT_EQ(result.output, "partial\n");
}

TEST_F(CodeExecutorTest, EachRunGetsPrivateWorkingDirectory) {
    CodeExecutor executor(config_);

    const auto first = executor.Execute(env_.Path(), "import os\nprint(os.getcwd())");
    const auto second = executor.Execute(env_.Path(), "import os\nprint(os.getcwd())");

    ASSERT_TRUE(first.Ok());
    ASSERT_TRUE(second.Ok());
    const auto first_dir = pyexec::utils::Trim(first.output);
    EXPECT_NE(first_dir, pyexec::utils::Trim(second.output));
    EXPECT_FALSE(std::filesystem::exists(first_dir));
}

TEST_F(CodeExecutorTest, MissingInterpreterIsSpawnFailure) {
    CodeExecutor executor(config_);
    pyexec::utils::ScopedTempDir empty_env("pyexec_executor_empty_");

    const auto result = executor.Execute(empty_env.Path(), "print(1)");

    EXPECT_EQ(result.kind, ErrorKind::kSpawnFailed);
    EXPECT_EQ(result.error.rfind("Error: failed to start interpreter: ", 0), 0u);
}

}  // namespace
}  // namespace pyexec::executor
