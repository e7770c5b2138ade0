#pragma once

#include <filesystem>
#include <string>

namespace pyexec::utils {

// Private directory under the system temp dir, removed with everything in it
// when the owner goes out of scope. Construction throws std::system_error when
// the directory cannot be created.
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix);
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Removes path recursively; failures are logged, never thrown.
bool RemoveTree(const std::filesystem::path& path, const std::string& tag);

}  // namespace pyexec::utils
