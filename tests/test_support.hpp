#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <sys/types.h>

#include "config/config_schema.hpp"
#include "utils/temp_dir.hpp"

namespace pyexec::test_support {

// Absolute path of the host python3, or empty when none is installed.
std::string FindPython3();

// False once pid is gone or only a zombie is left. Polls up to wait_ms.
bool ProcessAlive(pid_t pid, int wait_ms = 2000);

std::string ReadFile(const std::filesystem::path& path);

// Stand-in for `uv`: `venv PATH` links PATH/bin/python to the host python3,
// `pip install -r FILE --python PATH` copies FILE to PATH/installed.txt.
// A venv path containing "fail-create" or a requirement naming
// "does-not-exist" fails; a requirement naming "slow-package" sleeps 30s.
// Every invocation is appended to a log.
class FakeUv {
public:
    FakeUv();

    const std::filesystem::path& Command() const { return script_; }
    const std::filesystem::path& Dir() const { return dir_.Path(); }

    std::vector<std::string> Invocations() const;
    std::size_t Count(const std::string& subcommand) const;

private:
    pyexec::utils::ScopedTempDir dir_;
    std::filesystem::path script_;
    std::filesystem::path log_;
};

pyexec::config::Config MakeConfig(const FakeUv& uv, const std::filesystem::path& root);

}  // namespace pyexec::test_support
