#pragma once

#include <initializer_list>
#include <string>
#include <utility>

namespace pyexec::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

using LogField = std::pair<std::string, std::string>;

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Parses "debug", "info", "warn"/"warning", "error". Unknown names yield fallback.
LogLevel ParseLogLevel(const std::string& name, LogLevel fallback);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] LEVEL message key=value ..." to stderr as one line.
void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::initializer_list<LogField> fields = {});

}  // namespace pyexec::utils
