#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "service/execution_types.hpp"

namespace pyexec::executor {

class CodeExecutor {
public:
    explicit CodeExecutor(const pyexec::config::Config& config);

    // Runs code with the interpreter of the environment at env_path. The script
    // and its working directory are private to this call and removed afterwards.
    pyexec::service::ExecutionResult Execute(const std::filesystem::path& env_path,
                                             const std::string& code) const;

private:
    const pyexec::config::Config& config_;
};

}  // namespace pyexec::executor
