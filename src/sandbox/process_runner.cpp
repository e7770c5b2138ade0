#include "sandbox/process_runner.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"
#include "utils/temp_dir.hpp"

namespace pyexec::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

// Drops a multibyte UTF-8 sequence cut short at the end of data.
void DropPartialUtf8Tail(std::string& data) {
    std::size_t lead = data.size();
    std::size_t continuation = 0;
    while (lead > 0 && continuation < 3 &&
           (static_cast<unsigned char>(data[lead - 1]) & 0xC0) == 0x80) {
        --lead;
        ++continuation;
    }
    if (lead == 0) {
        return;
    }
    const auto byte = static_cast<unsigned char>(data[lead - 1]);
    std::size_t expected = 1;
    if ((byte & 0xE0) == 0xC0) {
        expected = 2;
    } else if ((byte & 0xF0) == 0xE0) {
        expected = 3;
    } else if ((byte & 0xF8) == 0xF0) {
        expected = 4;
    }
    if (continuation + 1 < expected) {
        data.resize(lead - 1);
    }
}

std::string ReadCapped(const std::filesystem::path& path, std::size_t max_bytes) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return {};
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::string data(static_cast<std::size_t>(std::min<std::uintmax_t>(size, max_bytes)), '\0');
    input.read(&data[0], static_cast<std::streamsize>(data.size()));
    data.resize(static_cast<std::size_t>(input.gcount()));
    if (size > max_bytes) {
        DropPartialUtf8Tail(data);
        data += kTruncatedMarker;
    }
    return data;
}

std::string ResolveExecutable(const std::string& command) {
    if (command.find('/') != std::string::npos) {
        return command;
    }
    const auto found = bp::search_path(command);
    return found.empty() ? std::string() : found.string();
}

// Kills every process left in the child's group. Descendants that outlive
// the child must not survive the call.
void KillGroup(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        pyexec::utils::Log(pyexec::utils::LogLevel::kWarn, "process", "group kill failed",
                           {{"pid", std::to_string(pid)}, {"errno", std::to_string(errno)}});
    }
}

}  // namespace

std::string ProcessRunner::FormatCommand(const std::string& command,
                                         const std::vector<std::string>& args) {
    std::ostringstream oss;
    oss << command;
    for (const auto& arg : args) {
        oss << " ";
        if (arg.empty() || arg.find_first_of(" \t\n'\"") != std::string::npos) {
            oss << "'" << arg << "'";
        } else {
            oss << arg;
        }
    }
    return oss.str();
}

ProcessResult ProcessRunner::Run(const std::string& command,
                                 const std::vector<std::string>& args,
                                 const std::filesystem::path& working_dir,
                                 std::chrono::seconds timeout,
                                 std::size_t max_output_bytes) {
    ProcessResult result{};
    const auto started = std::chrono::steady_clock::now();
    auto elapsed = [&started]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    };

    const auto executable = ResolveExecutable(command);
    if (executable.empty()) {
        result.run_error = "executable not found: " + command;
        return result;
    }

    try {
        pyexec::utils::ScopedTempDir capture_dir("pyexec_proc_");
        const auto stdout_path = capture_dir.Path() / "stdout.log";
        const auto stderr_path = capture_dir.Path() / "stderr.log";
        const auto start_dir = working_dir.empty()
            ? std::filesystem::current_path().string()
            : working_dir.string();

        bp::child child_process(
            bp::exe = executable,
            bp::args = args,
            bp::start_dir = start_dir,
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });

        const pid_t pid = child_process.id();
        const auto deadline = started + timeout;
        bool finished = false;
        int wait_errno = 0;
        // WNOWAIT leaves the exited child a zombie, so its pid (and with it
        // the group id) cannot be reused before the group is killed.
        while (std::chrono::steady_clock::now() < deadline) {
            siginfo_t info{};
            if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0) {
                if (info.si_pid == pid) {
                    finished = true;
                    break;
                }
            } else if (errno != EINTR) {
                wait_errno = errno;
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
        }

        KillGroup(pid);
        child_process.detach();
        if (wait_errno != 0) {
            result.run_error = std::string("wait failed: ") + std::strerror(wait_errno);
            result.duration = elapsed();
            return result;
        }
        result.timed_out = !finished;
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }

        if (result.timed_out) {
            result.exit_code = 124;
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }

        result.output = ReadCapped(stdout_path, max_output_bytes);
        result.error = ReadCapped(stderr_path, max_output_bytes);
    } catch (const bp::process_error& ex) {
        result.run_error = std::string("exec failed: ") + ex.what();
    } catch (const std::exception& ex) {
        result.run_error = ex.what();
    }

    result.duration = elapsed();
    pyexec::utils::Log(pyexec::utils::LogLevel::kDebug, "process", "finished", {
        {"command", FormatCommand(command, args)},
        {"exit_code", std::to_string(result.exit_code)},
        {"timed_out", result.timed_out ? "true" : "false"},
        {"duration_ms", std::to_string(result.duration.count())}});
    return result;
}

}  // namespace pyexec::sandbox
