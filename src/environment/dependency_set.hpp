#pragma once

#include <string>
#include <vector>

namespace pyexec::environment {

// Normalized dependency list. Specifiers keeps install order; equality is
// decided on the sorted key so ["a", "b"] and ["b", "a"] name the same set.
class DependencySet {
public:
    DependencySet() = default;

    const std::vector<std::string>& Specifiers() const { return specifiers_; }
    bool Empty() const { return specifiers_.empty(); }
    std::size_t Size() const { return specifiers_.size(); }

    // Specifiers joined by '\n', the requirements file format.
    std::string ToRequirements() const;

    bool operator==(const DependencySet& other) const { return key_ == other.key_; }
    bool operator!=(const DependencySet& other) const { return !(*this == other); }

    friend bool ResolveDependencies(const std::vector<std::string>& dependencies,
                                    DependencySet& resolved,
                                    std::string& error);

private:
    std::vector<std::string> specifiers_;
    std::vector<std::string> key_;
};

// Trims each specifier, drops blanks and duplicates. Returns false and sets
// error on a malformed specifier (line breaks, NUL, leading '-').
bool ResolveDependencies(const std::vector<std::string>& dependencies,
                         DependencySet& resolved,
                         std::string& error);

// Names become directory names: 1-64 chars of [A-Za-z0-9._-], no leading '.'.
bool ValidateEnvironmentName(const std::string& name, std::string& error);

}  // namespace pyexec::environment
