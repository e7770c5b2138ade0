#include "service/execution_service.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/temp_dir.hpp"

namespace pyexec::service {
namespace {

using pyexec::utils::Log;
using pyexec::utils::LogLevel;

}  // namespace

ExecutionService::ExecutionService(const pyexec::config::Config& config)
    : provisioner_(config)
    , cache_(pyexec::utils::ExpandHome(config.environments.root),
             [this](const std::filesystem::path& path,
                    const pyexec::environment::DependencySet& dependencies) {
                 return provisioner_.Provision(path, dependencies);
             })
    , executor_(config) {}

ExecutionResult ExecutionService::Execute(const ExecutionRequest& request) {
    ExecutionResult result{};
    try {
        pyexec::environment::DependencySet dependencies;
        std::string error;
        if (!pyexec::environment::ResolveDependencies(request.dependencies, dependencies, error)) {
            result = ExecutionResult::Failure(ErrorKind::kValidation, "Error: " + error);
        } else if (request.name) {
            result = ExecuteNamed(*request.name, request, dependencies);
        } else {
            result = ExecuteEphemeral(request, dependencies);
        }
    } catch (const std::exception& ex) {
        result = ExecutionResult::Failure(ErrorKind::kInternal, std::string("Unexpected error: ") + ex.what());
    }

    Log(result.Ok() ? LogLevel::kInfo : LogLevel::kWarn, "service", "request done", {
        {"name", request.name ? *request.name : std::string("(ephemeral)")},
        {"dependencies", std::to_string(request.dependencies.size())},
        {"kind", ToString(result.kind)}});
    return result;
}

ExecutionResult ExecutionService::ExecuteEphemeral(const ExecutionRequest& request,
                                                   const pyexec::environment::DependencySet& dependencies) {
    pyexec::utils::ScopedTempDir env_dir("pyexec_venv_");
    const auto provisioned = provisioner_.Provision(env_dir.Path(), dependencies);
    if (!provisioned.Ok()) {
        return ExecutionResult::Failure(provisioned.kind, provisioned.message);
    }
    return executor_.Execute(env_dir.Path(), request.code);
}

ExecutionResult ExecutionService::ExecuteNamed(const std::string& name,
                                               const ExecutionRequest& request,
                                               const pyexec::environment::DependencySet& dependencies) {
    std::string error;
    if (!pyexec::environment::ValidateEnvironmentName(name, error)) {
        return ExecutionResult::Failure(ErrorKind::kValidation, "Error: " + error);
    }
    auto acquired = cache_.Acquire(name, dependencies);
    if (!acquired.Ok()) {
        return ExecutionResult::Failure(acquired.kind, acquired.error);
    }
    return executor_.Execute(acquired.lease.Path(), request.code);
}

std::vector<pyexec::environment::EnvironmentInfo> ExecutionService::Environments() const {
    return cache_.Snapshot();
}

}  // namespace pyexec::service
