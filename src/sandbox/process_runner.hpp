#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace pyexec::sandbox {

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    // Set when the runner itself failed (spawn, wait); the child's streams are
    // then empty.
    std::string run_error;
    std::string output;
    std::string error;
    std::chrono::milliseconds duration{0};

    bool Ran() const { return run_error.empty(); }
    bool Succeeded() const { return Ran() && !timed_out && exit_code == 0; }
};

constexpr std::size_t kDefaultMaxOutputBytes = 1024 * 1024;
constexpr const char* kTruncatedMarker = "\n[output truncated]\n";

class ProcessRunner {
public:
    // Runs command with args in its own process group and waits at most
    // timeout. On expiry the whole group is killed with SIGKILL and reaped.
    // Never throws.
    static ProcessResult Run(const std::string& command,
                             const std::vector<std::string>& args,
                             const std::filesystem::path& working_dir,
                             std::chrono::seconds timeout,
                             std::size_t max_output_bytes = kDefaultMaxOutputBytes);

    // "cmd arg1 'arg two'" for logs.
    static std::string FormatCommand(const std::string& command,
                                     const std::vector<std::string>& args);
};

}  // namespace pyexec::sandbox
