#include "api/http_gateway.hpp"

#include "api/wire.hpp"
#include "utils/logging.hpp"

namespace pyexec::api {
namespace {

constexpr const char* kJsonContentType = "application/json";

void Send(httplib::Response& res, const HttpReply& reply) {
    res.status = reply.status;
    res.set_content(Serialize(reply.body), kJsonContentType);
}

}  // namespace

HttpGateway::HttpGateway(pyexec::service::ExecutionService& service)
    : service_(service) {}

void HttpGateway::RegisterRoutes(httplib::Server& server) {
    server.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        Send(res, HandleInfo());
    });
    server.Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
        Send(res, HandleExecute(req.body));
    });
    server.Get("/environments", [this](const httplib::Request&, httplib::Response& res) {
        Send(res, HandleEnvironments());
    });
}

HttpReply HttpGateway::HandleInfo() const {
    return {200, {
        {"message", "Python Code Execution API"},
        {"version", "1.0.0"},
        {"endpoint", "/execute"}
    }};
}

HttpReply HttpGateway::HandleExecute(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        return {422, {{"detail", "request body is not valid JSON"}}};
    }
    pyexec::service::ExecutionRequest request{};
    std::string error;
    if (!ParseExecutionRequest(json, request, error)) {
        pyexec::utils::Log(pyexec::utils::LogLevel::kInfo, "http", "rejected request", {{"detail", error}});
        return {422, {{"detail", error}}};
    }
    return {200, ToJson(service_.Execute(request))};
}

HttpReply HttpGateway::HandleEnvironments() const {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& info : service_.Environments()) {
        json.push_back(ToJson(info));
    }
    return {200, json};
}

}  // namespace pyexec::api
