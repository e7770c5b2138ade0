#pragma once

#include <string>

#include "environment/environment_cache.hpp"
#include "nlohmann/json.hpp"
#include "service/execution_types.hpp"

namespace pyexec::api {

// {code: string, lib?: string[] | null, name?: string | null}. Returns false
// and sets error on a schema violation.
bool ParseExecutionRequest(const nlohmann::json& body,
                           pyexec::service::ExecutionRequest& request,
                           std::string& error);

// {output, error}; the error kind stays internal.
nlohmann::json ToJson(const pyexec::service::ExecutionResult& result);

nlohmann::json ToJson(const pyexec::environment::EnvironmentInfo& info);

// Compact UTF-8 text of body. Interpreter output is arbitrary bytes, so
// invalid sequences are replaced with U+FFFD instead of throwing.
std::string Serialize(const nlohmann::json& body);

}  // namespace pyexec::api
