#include "environment/environment_cache.hpp"

#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/temp_dir.hpp"

namespace pyexec::environment {
namespace {

using pyexec::service::ErrorKind;
using pyexec::utils::Log;
using pyexec::utils::LogLevel;

std::optional<DependencySet> ReadManifest(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    auto json = nlohmann::json::parse(input, nullptr, false);
    if (!json.is_object() || !json.contains("dependencies") || !json["dependencies"].is_array()) {
        return std::nullopt;
    }
    std::vector<std::string> specifiers;
    for (const auto& item : json["dependencies"]) {
        if (!item.is_string()) {
            return std::nullopt;
        }
        specifiers.push_back(item.get<std::string>());
    }
    DependencySet dependencies;
    std::string error;
    if (!ResolveDependencies(specifiers, dependencies, error)) {
        return std::nullopt;
    }
    return dependencies;
}

}  // namespace

EnvironmentCache::EnvironmentCache(std::filesystem::path root, ProvisionHandler provision)
    : root_(std::move(root))
    , provision_(std::move(provision)) {}

std::shared_ptr<EnvironmentCache::Record> EnvironmentCache::GetRecord(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = records_[name];
    if (!record) {
        record = std::make_shared<Record>();
        record->name = name;
        record->path = root_ / name;
    }
    return record;
}

AcquireResult EnvironmentCache::Acquire(const std::string& name, const DependencySet& dependencies) {
    auto record = GetRecord(name);
    std::unique_lock<std::mutex> lock(record->mutex);
    while (true) {
        record->cv.wait(lock, [&record] { return record->state != EnvironmentState::kProvisioning; });

        if (record->state == EnvironmentState::kEmpty && TryAdopt(*record, dependencies)) {
            Log(LogLevel::kInfo, "cache", "adopted existing environment",
                {{"name", name}, {"path", record->path.string()}});
        }

        if (record->state == EnvironmentState::kReady && record->dependencies == dependencies) {
            Log(LogLevel::kDebug, "cache", "reuse", {{"name", name}});
            AcquireResult result{};
            result.lease = EnvironmentLease(
                record->path, record, std::shared_lock<std::shared_mutex>(record->usage));
            return result;
        }

        const auto previous = record->state;
        record->state = EnvironmentState::kProvisioning;
        lock.unlock();
        Log(LogLevel::kInfo, "cache", "provisioning", {
            {"name", name},
            {"previous_state", ToString(previous)},
            {"dependencies", std::to_string(dependencies.Size())}});
        const auto outcome = Rebuild(*record, dependencies);
        lock.lock();

        if (outcome.Ok()) {
            record->state = EnvironmentState::kReady;
            record->dependencies = dependencies;
            record->last_provisioned_at = pyexec::utils::Now();
            record->last_error.clear();
        } else {
            record->state = EnvironmentState::kFailed;
            record->last_error = outcome.message;
            Log(LogLevel::kWarn, "cache", "provisioning failed",
                {{"name", name}, {"kind", pyexec::service::ToString(outcome.kind)}});
        }
        record->cv.notify_all();

        if (!outcome.Ok()) {
            AcquireResult result{};
            result.kind = outcome.kind;
            result.error = outcome.message;
            return result;
        }
    }
}

bool EnvironmentCache::TryAdopt(Record& record, const DependencySet& dependencies) const {
    std::error_code ec;
    if (!std::filesystem::exists(InterpreterPath(record.path), ec)) {
        return false;
    }
    const auto stored = ReadManifest(record.path / kManifestFileName);
    if (!stored || *stored != dependencies) {
        return false;
    }
    record.state = EnvironmentState::kReady;
    record.dependencies = *stored;
    const auto modified = std::filesystem::last_write_time(record.path / kManifestFileName, ec);
    if (!ec) {
        record.last_provisioned_at = std::chrono::system_clock::now() -
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::filesystem::file_time_type::clock::now() - modified);
    }
    return true;
}

ProvisionResult EnvironmentCache::Rebuild(Record& record, const DependencySet& dependencies) {
    std::unique_lock<std::shared_mutex> usage(record.usage);
    if (!pyexec::utils::RemoveTree(record.path, "cache")) {
        return {ErrorKind::kInternal,
                "Failed to remove previous environment at " + record.path.string()};
    }
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return {ErrorKind::kInternal,
                "Failed to create environment root " + root_.string() + ": " + ec.message()};
    }

    ProvisionResult outcome{};
    try {
        outcome = provision_(record.path, dependencies);
    } catch (const std::exception& ex) {
        outcome = {ErrorKind::kInternal, std::string("Unexpected error while provisioning: ") + ex.what()};
    }
    if (outcome.Ok()) {
        WriteManifest(record, dependencies, pyexec::utils::Now());
    }
    return outcome;
}

void EnvironmentCache::WriteManifest(const Record& record,
                                     const DependencySet& dependencies,
                                     std::chrono::system_clock::time_point provisioned_at) const {
    nlohmann::json manifest = {
        {"name", record.name},
        {"dependencies", dependencies.Specifiers()},
        {"provisionedAt", pyexec::utils::FormatIso(provisioned_at)}
    };
    std::ofstream output(record.path / kManifestFileName, std::ios::trunc);
    if (!output.is_open()) {
        Log(LogLevel::kWarn, "cache", "cannot write manifest", {{"path", record.path.string()}});
        return;
    }
    output << manifest.dump(2);
}

std::vector<EnvironmentInfo> EnvironmentCache::Snapshot() const {
    std::vector<std::shared_ptr<Record>> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.reserve(records_.size());
        for (const auto& [name, record] : records_) {
            records.push_back(record);
        }
    }
    std::vector<EnvironmentInfo> infos;
    infos.reserve(records.size());
    for (const auto& record : records) {
        std::lock_guard<std::mutex> lock(record->mutex);
        EnvironmentInfo info{};
        info.name = record->name;
        info.state = record->state;
        info.dependencies = record->dependencies.Specifiers();
        info.path = record->path;
        info.last_provisioned_at = record->last_provisioned_at;
        info.last_error = record->last_error;
        infos.push_back(std::move(info));
    }
    return infos;
}

}  // namespace pyexec::environment
