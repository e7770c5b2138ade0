#pragma once

#include <string>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "service/execution_service.hpp"

namespace pyexec::api {

struct HttpReply {
    int status = 200;
    nlohmann::json body;
};

class HttpGateway {
public:
    explicit HttpGateway(pyexec::service::ExecutionService& service);

    void RegisterRoutes(httplib::Server& server);

    HttpReply HandleInfo() const;
    HttpReply HandleExecute(const std::string& body);
    HttpReply HandleEnvironments() const;

private:
    pyexec::service::ExecutionService& service_;
};

}  // namespace pyexec::api
