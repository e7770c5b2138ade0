#include "utils/logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>

#include "utils/common.hpp"

namespace pyexec::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_log_mutex;

bool NeedsQuoting(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    for (const char c : value) {
        if (c == ' ' || c == '\n' || c == '\t' || c == '"' || c == '=') {
            return true;
        }
    }
    return false;
}

std::string Quote(const std::string& value) {
    std::string quoted = "\"";
    for (const char c : value) {
        switch (c) {
            case '"': quoted += "\\\""; break;
            case '\\': quoted += "\\\\"; break;
            case '\n': quoted += "\\n"; break;
            case '\t': quoted += "\\t"; break;
            default: quoted += c; break;
        }
    }
    quoted += "\"";
    return quoted;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& name, LogLevel fallback) {
    const auto lowered = ToLower(Trim(name));
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(config.min_level);
}

LogConfig GetLogConfig() {
    return LogConfig{g_min_level.load()};
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::initializer_list<LogField> fields) {
    if (static_cast<int>(level) < static_cast<int>(g_min_level.load())) {
        return;
    }
    std::ostringstream line;
    line << "[" << tag << "] " << ToString(level) << " " << message;
    for (const auto& [key, value] : fields) {
        line << " " << key << "=" << (NeedsQuoting(value) ? Quote(value) : value);
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << line.str() << std::endl;
}

}  // namespace pyexec::utils
