#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pyexec::service {

enum class ErrorKind {
    kNone,
    kValidation,
    kCreationTimeout,
    kCreationFailed,
    kInstallTimeout,
    kInstallFailed,
    kExecutionTimeout,
    kNonZeroExit,
    kSpawnFailed,
    kInternal
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "none";
        case ErrorKind::kValidation: return "validation";
        case ErrorKind::kCreationTimeout: return "creation-timeout";
        case ErrorKind::kCreationFailed: return "creation-failed";
        case ErrorKind::kInstallTimeout: return "install-timeout";
        case ErrorKind::kInstallFailed: return "install-failed";
        case ErrorKind::kExecutionTimeout: return "execution-timeout";
        case ErrorKind::kNonZeroExit: return "non-zero-exit";
        case ErrorKind::kSpawnFailed: return "process-spawn-failed";
        case ErrorKind::kInternal: return "internal";
    }
    return "unknown";
}

inline bool IsProvisioningError(ErrorKind kind) {
    return kind == ErrorKind::kCreationTimeout || kind == ErrorKind::kCreationFailed ||
           kind == ErrorKind::kInstallTimeout || kind == ErrorKind::kInstallFailed;
}

struct ExecutionRequest {
    std::string code;
    std::vector<std::string> dependencies;
    std::optional<std::string> name;
};

struct ExecutionResult {
    std::string output;
    std::string error;
    ErrorKind kind = ErrorKind::kNone;

    bool Ok() const { return error.empty(); }

    static ExecutionResult Failure(ErrorKind kind, std::string error, std::string output = {}) {
        ExecutionResult result{};
        result.output = std::move(output);
        result.error = std::move(error);
        result.kind = kind;
        return result;
    }
};

}  // namespace pyexec::service
