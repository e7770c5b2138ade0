#include "environment/provisioner.hpp"

#include <chrono>
#include <fstream>
#include <system_error>
#include <vector>

#include "sandbox/process_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/temp_dir.hpp"

namespace pyexec::environment {
namespace {

using pyexec::sandbox::ProcessResult;
using pyexec::sandbox::ProcessRunner;
using pyexec::service::ErrorKind;
using pyexec::utils::Log;
using pyexec::utils::LogLevel;

void LogCommand(const std::string& phase,
                const std::string& command,
                const std::vector<std::string>& args,
                const ProcessResult& result) {
    const auto level = result.Succeeded() ? LogLevel::kInfo : LogLevel::kWarn;
    Log(level, "provision", phase, {
        {"command", ProcessRunner::FormatCommand(command, args)},
        {"started_at", pyexec::utils::FormatIso(
            pyexec::utils::Now() - std::chrono::duration_cast<std::chrono::system_clock::duration>(result.duration))},
        {"duration_ms", std::to_string(result.duration.count())},
        {"exit_code", std::to_string(result.exit_code)},
        {"timed_out", result.timed_out ? "true" : "false"}});
    if (!result.output.empty()) {
        Log(LogLevel::kDebug, "provision", phase + " stdout", {{"text", result.output}});
    }
    if (!result.error.empty()) {
        Log(LogLevel::kDebug, "provision", phase + " stderr", {{"text", result.error}});
    }
    if (!result.run_error.empty()) {
        Log(LogLevel::kWarn, "provision", phase + " could not run", {{"error", result.run_error}});
    }
}

// stderr when the tool wrote any, otherwise whatever else explains the failure.
std::string Reason(const ProcessResult& result) {
    if (!result.run_error.empty()) {
        return result.run_error;
    }
    const auto error = pyexec::utils::Trim(result.error);
    if (!error.empty()) {
        return error;
    }
    const auto output = pyexec::utils::Trim(result.output);
    if (!output.empty()) {
        return output;
    }
    return "exit code " + std::to_string(result.exit_code);
}

}  // namespace

std::filesystem::path InterpreterPath(const std::filesystem::path& env_path) {
    return env_path / "bin" / "python";
}

EnvironmentProvisioner::EnvironmentProvisioner(const pyexec::config::Config& config)
    : config_(config) {}

ProvisionResult EnvironmentProvisioner::Provision(const std::filesystem::path& path,
                                                  const DependencySet& dependencies) const {
    auto created = CreateEnvironment(path);
    if (!created.Ok()) {
        return created;
    }
    if (dependencies.Empty()) {
        return {};
    }
    return InstallDependencies(path, dependencies);
}

ProvisionResult EnvironmentProvisioner::CreateEnvironment(const std::filesystem::path& path) const {
    const auto& command = config_.environments.uv_command;
    const std::vector<std::string> args = {"venv", path.string()};
    const auto timeout = std::chrono::seconds(config_.timeouts.creation_s);
    const auto result = ProcessRunner::Run(
        command, args, path.parent_path(), timeout, config_.environments.max_output_bytes);
    LogCommand("create", command, args, result);

    if (result.timed_out) {
        return {ErrorKind::kCreationTimeout,
                "Failed to create virtual environment: timed out after " +
                    std::to_string(config_.timeouts.creation_s) + "s"};
    }
    if (!result.Succeeded()) {
        return {ErrorKind::kCreationFailed,
                "Failed to create virtual environment: " + Reason(result)};
    }
    return {};
}

ProvisionResult EnvironmentProvisioner::InstallDependencies(const std::filesystem::path& path,
                                                            const DependencySet& dependencies) const {
    try {
        pyexec::utils::ScopedTempDir scratch("pyexec_req_");
        const auto requirements = scratch.Path() / "requirements.txt";
        {
            std::ofstream output(requirements, std::ios::trunc);
            if (!output.is_open()) {
                return {ErrorKind::kInternal,
                        "Failed to install dependencies: cannot write " + requirements.string()};
            }
            output << dependencies.ToRequirements();
        }

        const auto& command = config_.environments.uv_command;
        const std::vector<std::string> args = {
            "pip", "install", "-r", requirements.string(), "--python", path.string()};
        const auto timeout = std::chrono::seconds(config_.timeouts.install_s);
        const auto result = ProcessRunner::Run(
            command, args, scratch.Path(), timeout, config_.environments.max_output_bytes);
        LogCommand("install", command, args, result);

        if (result.timed_out) {
            return {ErrorKind::kInstallTimeout,
                    "Failed to install dependencies: timed out after " +
                        std::to_string(config_.timeouts.install_s) + "s"};
        }
        if (!result.Succeeded()) {
            return {ErrorKind::kInstallFailed, "Failed to install dependencies: " + Reason(result)};
        }
    } catch (const std::system_error& ex) {
        return {ErrorKind::kInternal, std::string("Failed to install dependencies: ") + ex.what()};
    }
    return {};
}

}  // namespace pyexec::environment
