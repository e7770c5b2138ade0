#include "api/wire.hpp"

#include "utils/common.hpp"

namespace pyexec::api {

bool ParseExecutionRequest(const nlohmann::json& body,
                           pyexec::service::ExecutionRequest& request,
                           std::string& error) {
    if (!body.is_object()) {
        error = "request body must be a JSON object";
        return false;
    }
    if (!body.contains("code")) {
        error = "field 'code' is required";
        return false;
    }
    if (!body["code"].is_string()) {
        error = "field 'code' must be a string";
        return false;
    }

    pyexec::service::ExecutionRequest parsed{};
    parsed.code = body["code"].get<std::string>();

    if (body.contains("lib") && !body["lib"].is_null()) {
        const auto& lib = body["lib"];
        if (!lib.is_array()) {
            error = "field 'lib' must be an array of strings";
            return false;
        }
        for (const auto& item : lib) {
            if (!item.is_string()) {
                error = "field 'lib' must contain only strings";
                return false;
            }
            parsed.dependencies.push_back(item.get<std::string>());
        }
    }

    if (body.contains("name") && !body["name"].is_null()) {
        if (!body["name"].is_string()) {
            error = "field 'name' must be a string";
            return false;
        }
        parsed.name = body["name"].get<std::string>();
    }

    request = std::move(parsed);
    return true;
}

nlohmann::json ToJson(const pyexec::service::ExecutionResult& result) {
    return {
        {"output", result.output},
        {"error", result.error}
    };
}

nlohmann::json ToJson(const pyexec::environment::EnvironmentInfo& info) {
    nlohmann::json json = nlohmann::json::object();
    json["name"] = info.name;
    json["state"] = pyexec::environment::ToString(info.state);
    json["dependencies"] = info.dependencies;
    json["path"] = info.path.string();
    json["last_provisioned_at"] = info.last_provisioned_at.has_value()
        ? nlohmann::json(pyexec::utils::FormatIso(*info.last_provisioned_at))
        : nlohmann::json(nullptr);
    json["last_error"] = info.last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(info.last_error);
    return json;
}

std::string Serialize(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace pyexec::api
