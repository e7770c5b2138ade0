#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "environment/dependency_set.hpp"
#include "service/execution_types.hpp"

namespace pyexec::environment {

struct ProvisionResult {
    pyexec::service::ErrorKind kind = pyexec::service::ErrorKind::kNone;
    std::string message;

    bool Ok() const { return kind == pyexec::service::ErrorKind::kNone; }
};

// Interpreter inside a virtual environment created by `uv venv`.
std::filesystem::path InterpreterPath(const std::filesystem::path& env_path);

class EnvironmentProvisioner {
public:
    explicit EnvironmentProvisioner(const pyexec::config::Config& config);

    // Creates a virtual environment at path, then installs dependencies into it.
    // A failed install leaves the created environment in place.
    ProvisionResult Provision(const std::filesystem::path& path,
                              const DependencySet& dependencies) const;

private:
    ProvisionResult CreateEnvironment(const std::filesystem::path& path) const;
    ProvisionResult InstallDependencies(const std::filesystem::path& path,
                                        const DependencySet& dependencies) const;

    const pyexec::config::Config& config_;
};

}  // namespace pyexec::environment
