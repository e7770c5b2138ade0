#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pyexec::config {
namespace {

using pyexec::utils::Log;
using pyexec::utils::LogLevel;

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

long long ParseLong(const std::string& value, long long fallback) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        return fallback;
    }
}

void SetPositive(int& target, long long value, const char* key) {
    if (value <= 0 || value > std::numeric_limits<int>::max()) {
        Log(LogLevel::kWarn, "config", "ignoring non-positive value",
            {{"key", key}, {"value", std::to_string(value)}});
        return;
    }
    target = static_cast<int>(value);
}

void SetPositive(std::size_t& target, long long value, const char* key) {
    if (value <= 0) {
        Log(LogLevel::kWarn, "config", "ignoring non-positive value",
            {{"key", key}, {"value", std::to_string(value)}});
        return;
    }
    target = static_cast<std::size_t>(value);
}

void ApplyPositiveJson(int& target, const nlohmann::json& section, const char* field, const char* key) {
    if (!section.contains(field)) {
        return;
    }
    if (!section[field].is_number_integer()) {
        Log(LogLevel::kWarn, "config", "expected integer", {{"key", key}});
        return;
    }
    SetPositive(target, section[field].get<long long>(), key);
}

void ApplyPositiveEnv(int& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (value.empty()) {
        return;
    }
    SetPositive(target, ParseLong(value, 0), primary);
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto override_path = GetEnv("PYEXEC_CONFIG");
    if (!override_path.empty()) {
        return pyexec::utils::ExpandHome(override_path);
    }
    return pyexec::utils::GetHomePath() / ".pyexec" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("timeouts") && data["timeouts"].is_object()) {
        const auto& timeouts = data["timeouts"];
        ApplyPositiveJson(config.timeouts.creation_s, timeouts, "creationS", "timeouts.creationS");
        ApplyPositiveJson(config.timeouts.install_s, timeouts, "installS", "timeouts.installS");
        ApplyPositiveJson(config.timeouts.execution_s, timeouts, "executionS", "timeouts.executionS");
    }

    if (data.contains("environments") && data["environments"].is_object()) {
        const auto& environments = data["environments"];
        if (environments.contains("root") && environments["root"].is_string()) {
            config.environments.root = environments["root"].get<std::string>();
        }
        if (environments.contains("uvCommand") && environments["uvCommand"].is_string()) {
            config.environments.uv_command = environments["uvCommand"].get<std::string>();
        }
        if (environments.contains("maxOutputBytes") && environments["maxOutputBytes"].is_number_integer()) {
            SetPositive(config.environments.max_output_bytes,
                        environments["maxOutputBytes"].get<long long>(),
                        "environments.maxOutputBytes");
        }
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        if (server.contains("host") && server["host"].is_string()) {
            config.server.host = server["host"].get<std::string>();
        }
        ApplyPositiveJson(config.server.port, server, "port", "server.port");
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.min_level = pyexec::utils::ParseLogLevel(
                logging["level"].get<std::string>(),
                config.logging.min_level);
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    ApplyPositiveEnv(config.timeouts.creation_s,
                     "PYEXEC_TIMEOUTS__CREATION_S",
                     "PYEXEC_CREATION_TIMEOUT");
    ApplyPositiveEnv(config.timeouts.install_s,
                     "PYEXEC_TIMEOUTS__INSTALL_S",
                     "PYEXEC_INSTALL_TIMEOUT");
    ApplyPositiveEnv(config.timeouts.execution_s,
                     "PYEXEC_TIMEOUTS__EXECUTION_S",
                     "PYEXEC_EXECUTION_TIMEOUT");

    const auto root = GetEnvFallback(
        "PYEXEC_ENVIRONMENTS__ROOT",
        "PYEXEC_ENV_ROOT");
    if (!root.empty()) {
        config.environments.root = root;
    }

    const auto uv_command = GetEnvFallback(
        "PYEXEC_ENVIRONMENTS__UV_COMMAND",
        "PYEXEC_UV");
    if (!uv_command.empty()) {
        config.environments.uv_command = uv_command;
    }

    const auto max_output = GetEnvFallback(
        "PYEXEC_ENVIRONMENTS__MAX_OUTPUT_BYTES",
        "PYEXEC_MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        SetPositive(config.environments.max_output_bytes,
                    ParseLong(max_output, 0),
                    "PYEXEC_ENVIRONMENTS__MAX_OUTPUT_BYTES");
    }

    const auto host = GetEnvFallback(
        "PYEXEC_SERVER__HOST",
        "PYEXEC_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    ApplyPositiveEnv(config.server.port,
                     "PYEXEC_SERVER__PORT",
                     "PYEXEC_PORT");

    const auto level = GetEnvFallback(
        "PYEXEC_LOGGING__LEVEL",
        "PYEXEC_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.min_level = pyexec::utils::ParseLogLevel(level, config.logging.min_level);
    }
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            Log(LogLevel::kWarn, "config", "keeping defaults, config file unreadable",
                {{"path", config_path.string()}, {"error", ex.what()}});
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

}  // namespace pyexec::config
