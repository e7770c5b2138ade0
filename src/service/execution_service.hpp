#pragma once

#include <vector>

#include "config/config_schema.hpp"
#include "environment/environment_cache.hpp"
#include "environment/provisioner.hpp"
#include "executor/code_executor.hpp"
#include "service/execution_types.hpp"

namespace pyexec::service {

// Entry point for the request layer: resolves the environment (ephemeral or
// named), runs the code in it and reports every failure inside the result.
class ExecutionService {
public:
    explicit ExecutionService(const pyexec::config::Config& config);

    ExecutionResult Execute(const ExecutionRequest& request);

    std::vector<pyexec::environment::EnvironmentInfo> Environments() const;

private:
    ExecutionResult ExecuteEphemeral(const ExecutionRequest& request,
                                     const pyexec::environment::DependencySet& dependencies);
    ExecutionResult ExecuteNamed(const std::string& name,
                                 const ExecutionRequest& request,
                                 const pyexec::environment::DependencySet& dependencies);

    pyexec::environment::EnvironmentProvisioner provisioner_;
    pyexec::environment::EnvironmentCache cache_;
    pyexec::executor::CodeExecutor executor_;
};

}  // namespace pyexec::service
