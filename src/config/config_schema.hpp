#pragma once

#include <cstddef>
#include <string>

#include "utils/logging.hpp"

namespace pyexec::config {

struct TimeoutsConfig {
    int creation_s = 30;
    int install_s = 300;
    int execution_s = 30;
};

struct EnvironmentsConfig {
    std::string root = "~/.pyexec/environments";
    std::string uv_command = "uv";
    std::size_t max_output_bytes = 1024 * 1024;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
};

struct Config {
    TimeoutsConfig timeouts;
    EnvironmentsConfig environments;
    ServerConfig server;
    pyexec::utils::LogConfig logging;
};

}  // namespace pyexec::config
