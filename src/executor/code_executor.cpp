#include "executor/code_executor.hpp"

#include <fstream>
#include <system_error>

#include "environment/provisioner.hpp"
#include "sandbox/process_runner.hpp"
#include "utils/logging.hpp"
#include "utils/temp_dir.hpp"

namespace pyexec::executor {
namespace {

using pyexec::service::ErrorKind;
using pyexec::service::ExecutionResult;
using pyexec::utils::Log;
using pyexec::utils::LogLevel;

constexpr const char* kScriptName = "main.py";
// Unbuffered, so output printed before a timeout kill is still captured.
constexpr const char* kUnbufferedFlag = "-u";

}  // namespace

CodeExecutor::CodeExecutor(const pyexec::config::Config& config)
    : config_(config) {}

ExecutionResult CodeExecutor::Execute(const std::filesystem::path& env_path,
                                      const std::string& code) const {
    try {
        pyexec::utils::ScopedTempDir workdir("pyexec_run_");
        const auto script = workdir.Path() / kScriptName;
        {
            std::ofstream output(script, std::ios::binary | std::ios::trunc);
            if (!output.is_open()) {
                return ExecutionResult::Failure(ErrorKind::kInternal,
                                                "Error: cannot write script " + script.string());
            }
            output << code;
        }

        const auto interpreter = pyexec::environment::InterpreterPath(env_path);
        const auto result = pyexec::sandbox::ProcessRunner::Run(
            interpreter.string(),
            {kUnbufferedFlag, kScriptName},
            workdir.Path(),
            std::chrono::seconds(config_.timeouts.execution_s),
            config_.environments.max_output_bytes);

        Log(LogLevel::kInfo, "exec", "finished", {
            {"env", env_path.string()},
            {"exit_code", std::to_string(result.exit_code)},
            {"timed_out", result.timed_out ? "true" : "false"},
            {"duration_ms", std::to_string(result.duration.count())}});

        if (!result.Ran()) {
            return ExecutionResult::Failure(ErrorKind::kSpawnFailed,
                                            "Error: failed to start interpreter: " + result.run_error);
        }
        if (result.timed_out) {
            return ExecutionResult::Failure(
                ErrorKind::kExecutionTimeout,
                "Error: Code execution timed out (" + std::to_string(config_.timeouts.execution_s) +
                    " seconds limit)",
                result.output);
        }
        if (result.exit_code != 0) {
            auto error = result.error.empty()
                ? "Error: process exited with code " + std::to_string(result.exit_code)
                : result.error;
            return ExecutionResult::Failure(ErrorKind::kNonZeroExit, std::move(error), result.output);
        }
        ExecutionResult success{};
        success.output = result.output;
        return success;
    } catch (const std::system_error& ex) {
        return ExecutionResult::Failure(ErrorKind::kInternal, std::string("Error: ") + ex.what());
    }
}

}  // namespace pyexec::executor
