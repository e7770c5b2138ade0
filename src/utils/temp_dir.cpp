#include "utils/temp_dir.hpp"

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

#include "utils/logging.hpp"

namespace pyexec::utils {

ScopedTempDir::ScopedTempDir(const std::string& prefix) {
    const auto pattern = (std::filesystem::temp_directory_path() / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(),
                                "failed to create temporary directory " + pattern);
    }
    path_ = std::filesystem::path(buffer.data());
}

ScopedTempDir::~ScopedTempDir() {
    RemoveTree(path_, "tmp");
}

bool RemoveTree(const std::filesystem::path& path, const std::string& tag) {
    if (path.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        Log(LogLevel::kWarn, tag, "cleanup failed", {{"path", path.string()}, {"error", ec.message()}});
        return false;
    }
    return true;
}

}  // namespace pyexec::utils
