#include "environment/dependency_set.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "utils/common.hpp"

namespace pyexec::environment {
namespace {

constexpr std::size_t kMaxNameLength = 64;

}  // namespace

std::string DependencySet::ToRequirements() const {
    return pyexec::utils::Join(specifiers_, "\n") + (specifiers_.empty() ? "" : "\n");
}

bool ResolveDependencies(const std::vector<std::string>& dependencies,
                         DependencySet& resolved,
                         std::string& error) {
    DependencySet result;
    std::unordered_set<std::string> seen;
    for (const auto& raw : dependencies) {
        const auto specifier = pyexec::utils::Trim(raw);
        if (specifier.empty()) {
            continue;
        }
        if (specifier.find_first_of(std::string("\r\n\0", 3)) != std::string::npos) {
            error = "invalid dependency specifier: line breaks are not allowed";
            return false;
        }
        if (specifier.front() == '-') {
            error = "invalid dependency specifier '" + specifier + "': options are not allowed";
            return false;
        }
        if (seen.insert(specifier).second) {
            result.specifiers_.push_back(specifier);
        }
    }
    result.key_ = result.specifiers_;
    std::sort(result.key_.begin(), result.key_.end());
    resolved = std::move(result);
    return true;
}

bool ValidateEnvironmentName(const std::string& name, std::string& error) {
    if (name.empty() || name.size() > kMaxNameLength) {
        error = "invalid environment name: must be 1-64 characters";
        return false;
    }
    if (name.front() == '.') {
        error = "invalid environment name '" + name + "': must not start with '.'";
        return false;
    }
    const bool allowed = std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
    if (!allowed) {
        error = "invalid environment name '" + name + "': only letters, digits, '.', '_' and '-' are allowed";
        return false;
    }
    return true;
}

}  // namespace pyexec::environment
