#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "environment/dependency_set.hpp"
#include "environment/provisioner.hpp"
#include "service/execution_types.hpp"

namespace pyexec::environment {

enum class EnvironmentState {
    kEmpty,
    kProvisioning,
    kReady,
    kFailed
};

inline const char* ToString(EnvironmentState state) {
    switch (state) {
        case EnvironmentState::kEmpty: return "empty";
        case EnvironmentState::kProvisioning: return "provisioning";
        case EnvironmentState::kReady: return "ready";
        case EnvironmentState::kFailed: return "failed";
    }
    return "unknown";
}

constexpr const char* kManifestFileName = ".pyexec-environment.json";

struct EnvironmentInfo {
    std::string name;
    EnvironmentState state = EnvironmentState::kEmpty;
    std::vector<std::string> dependencies;
    std::filesystem::path path;
    std::optional<std::chrono::system_clock::time_point> last_provisioned_at;
    std::string last_error;
};

// Shared use of a Ready named environment. The environment is not recreated
// while any lease on it is alive.
class EnvironmentLease {
public:
    EnvironmentLease() = default;
    EnvironmentLease(EnvironmentLease&&) = default;
    // Releases the held usage lock before the record it belongs to.
    EnvironmentLease& operator=(EnvironmentLease&& other) noexcept {
        if (this != &other) {
            usage_ = std::move(other.usage_);
            keepalive_ = std::move(other.keepalive_);
            path_ = std::move(other.path_);
        }
        return *this;
    }

    const std::filesystem::path& Path() const { return path_; }
    bool Valid() const { return usage_.owns_lock(); }

private:
    friend class EnvironmentCache;
    EnvironmentLease(std::filesystem::path path,
                     std::shared_ptr<void> keepalive,
                     std::shared_lock<std::shared_mutex> usage)
        : keepalive_(std::move(keepalive))
        , path_(std::move(path))
        , usage_(std::move(usage)) {}

    // Declared first so it is destroyed after usage_ is unlocked.
    std::shared_ptr<void> keepalive_;
    std::filesystem::path path_;
    std::shared_lock<std::shared_mutex> usage_;
};

struct AcquireResult {
    EnvironmentLease lease;
    pyexec::service::ErrorKind kind = pyexec::service::ErrorKind::kNone;
    std::string error;

    bool Ok() const { return kind == pyexec::service::ErrorKind::kNone; }
};

class EnvironmentCache {
public:
    using ProvisionHandler =
        std::function<ProvisionResult(const std::filesystem::path&, const DependencySet&)>;

    EnvironmentCache(std::filesystem::path root, ProvisionHandler provision);

    // Returns a lease on the environment called name holding exactly
    // dependencies, provisioning it first when needed. Provisioning of one
    // name is serialized; concurrent callers wait and reuse the outcome.
    AcquireResult Acquire(const std::string& name, const DependencySet& dependencies);

    std::vector<EnvironmentInfo> Snapshot() const;

    const std::filesystem::path& Root() const { return root_; }

private:
    struct Record {
        std::string name;
        std::filesystem::path path;
        EnvironmentState state = EnvironmentState::kEmpty;
        DependencySet dependencies;
        std::optional<std::chrono::system_clock::time_point> last_provisioned_at;
        std::string last_error;
        std::mutex mutex;
        std::condition_variable cv;
        // Shared by leases, exclusive while the directory is rebuilt.
        std::shared_mutex usage;
    };

    std::shared_ptr<Record> GetRecord(const std::string& name);
    bool TryAdopt(Record& record, const DependencySet& dependencies) const;
    ProvisionResult Rebuild(Record& record, const DependencySet& dependencies);
    void WriteManifest(const Record& record,
                       const DependencySet& dependencies,
                       std::chrono::system_clock::time_point provisioned_at) const;

    std::filesystem::path root_;
    ProvisionHandler provision_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Record>> records_;
};

}  // namespace pyexec::environment
