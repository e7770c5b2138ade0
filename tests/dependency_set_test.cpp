#include <gtest/gtest.h>

#include "environment/dependency_set.hpp"

namespace pyexec::environment {
namespace {

DependencySet Resolve(const std::vector<std::string>& dependencies) {
    DependencySet resolved;
    std::string error;
    EXPECT_TRUE(ResolveDependencies(dependencies, resolved, error)) << error;
    return resolved;
}

TEST(DependencySetTest, TrimsAndKeepsSpecifiersVerbatim) {
    const auto set = Resolve({"  requests==2.31.0 ", "pandas >=2.0, <3"});

    EXPECT_EQ(set.Specifiers(), (std::vector<std::string>{"requests==2.31.0", "pandas >=2.0, <3"}));
}

TEST(DependencySetTest, DropsBlanksAndDuplicatesKeepingFirstOrder) {
    const auto set = Resolve({"b", "", "a", "  ", "b", " a"});

    EXPECT_EQ(set.Specifiers(), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(set.Size(), 2u);
}

TEST(DependencySetTest, EqualityIgnoresOrder) {
    EXPECT_EQ(Resolve({"requests==2.31.0", "pandas==2.0.0"}),
              Resolve({"pandas==2.0.0", "requests==2.31.0"}));
    EXPECT_NE(Resolve({"requests==2.31.0"}),
              Resolve({"requests==2.31.0", "pandas==2.0.0"}));
    EXPECT_NE(Resolve({"requests==2.31.0"}), Resolve({"requests==2.32.0"}));
}

TEST(DependencySetTest, EmptyListsAreEqual) {
    EXPECT_TRUE(Resolve({}).Empty());
    EXPECT_EQ(Resolve({}), Resolve({" "}));
    EXPECT_EQ(DependencySet(), Resolve({}));
}

TEST(DependencySetTest, RequirementsFileFormat) {
    EXPECT_EQ(Resolve({"a==1", "b"}).ToRequirements(), "a==1\nb\n");
    EXPECT_EQ(Resolve({}).ToRequirements(), "");
}

TEST(DependencySetTest, RejectsLineBreaks) {
    DependencySet resolved;
    std::string error;
    EXPECT_FALSE(ResolveDependencies({"requests\n--index-url http://evil"}, resolved, error));
    EXPECT_FALSE(error.empty());
}

TEST(DependencySetTest, RejectsInstallerOptions) {
    DependencySet resolved;
    std::string error;
    EXPECT_FALSE(ResolveDependencies({"-e ."}, resolved, error));
    EXPECT_NE(error.find("-e ."), std::string::npos);
}

TEST(EnvironmentNameTest, AcceptsPlainIdentifiers) {
    std::string error;
    EXPECT_TRUE(ValidateEnvironmentName("x", error));
    EXPECT_TRUE(ValidateEnvironmentName("data-science_3.11", error));
    EXPECT_TRUE(ValidateEnvironmentName(std::string(64, 'a'), error));
}

TEST(EnvironmentNameTest, RejectsPathLikeNames) {
    std::string error;
    EXPECT_FALSE(ValidateEnvironmentName("", error));
    EXPECT_FALSE(ValidateEnvironmentName(".", error));
    EXPECT_FALSE(ValidateEnvironmentName("..", error));
    EXPECT_FALSE(ValidateEnvironmentName(".hidden", error));
    EXPECT_FALSE(ValidateEnvironmentName("../etc", error));
    EXPECT_FALSE(ValidateEnvironmentName("a/b", error));
    EXPECT_FALSE(ValidateEnvironmentName("with space", error));
    EXPECT_FALSE(ValidateEnvironmentName(std::string(65, 'a'), error));
}

}  // namespace
}  // namespace pyexec::environment
