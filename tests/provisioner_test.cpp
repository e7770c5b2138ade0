#include <gtest/gtest.h>

#include <filesystem>

#include "environment/provisioner.hpp"
#include "test_support.hpp"
#include "utils/temp_dir.hpp"

namespace pyexec::environment {
namespace {

using pyexec::service::ErrorKind;
using pyexec::test_support::FakeUv;
using pyexec::test_support::MakeConfig;
using pyexec::test_support::ReadFile;

DependencySet Deps(const std::vector<std::string>& specifiers) {
    DependencySet resolved;
    std::string error;
    EXPECT_TRUE(ResolveDependencies(specifiers, resolved, error)) << error;
    return resolved;
}

class ProvisionerTest : public ::testing::Test {
protected:
    ProvisionerTest()
        : root_("pyexec_provision_test_")
        , config_(MakeConfig(uv_, root_.Path())) {}

    FakeUv uv_;
    pyexec::utils::ScopedTempDir root_;
    pyexec::config::Config config_;
};

TEST_F(ProvisionerTest, CreatesEnvironmentAndInstallsDependencies) {
    EnvironmentProvisioner provisioner(config_);
    const auto path = root_.Path() / "env";

    const auto result = provisioner.Provision(path, Deps({"requests==2.31.0", "pandas==2.0.0"}));

    ASSERT_TRUE(result.Ok()) << result.message;
    EXPECT_TRUE(std::filesystem::exists(InterpreterPath(path)));
    EXPECT_EQ(ReadFile(path / "installed.txt"), "requests==2.31.0\npandas==2.0.0\n");

    const auto calls = uv_.Invocations();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "venv " + path.string());
    EXPECT_EQ(calls[1].rfind("pip install -r ", 0), 0u);
    EXPECT_NE(calls[1].find("--python " + path.string()), std::string::npos);
}

TEST_F(ProvisionerTest, SkipsInstallWithoutDependencies) {
    EnvironmentProvisioner provisioner(config_);

    const auto result = provisioner.Provision(root_.Path() / "env", Deps({}));

    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(uv_.Count("venv"), 1u);
    EXPECT_EQ(uv_.Count("pip"), 0u);
}

TEST_F(ProvisionerTest, CreationFailureStopsBeforeInstall) {
    EnvironmentProvisioner provisioner(config_);

    const auto result = provisioner.Provision(root_.Path() / "fail-create", Deps({"requests"}));

    EXPECT_EQ(result.kind, ErrorKind::kCreationFailed);
    EXPECT_EQ(result.message,
              "Failed to create virtual environment: boom: cannot create environment");
    EXPECT_EQ(uv_.Count("pip"), 0u);
}

TEST_F(ProvisionerTest, InstallFailureCarriesInstallerDiagnostic) {
    EnvironmentProvisioner provisioner(config_);
    const auto path = root_.Path() / "env";

    const auto result = provisioner.Provision(path, Deps({"does-not-exist==9.9"}));

    EXPECT_EQ(result.kind, ErrorKind::kInstallFailed);
    EXPECT_NE(result.message.find("Failed to install dependencies: "), std::string::npos);
    EXPECT_NE(result.message.find("No solution found"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(InterpreterPath(path)));
}

TEST_F(ProvisionerTest, InstallTimeoutIsReported) {
    config_.timeouts.install_s = 1;
    EnvironmentProvisioner provisioner(config_);

    const auto result = provisioner.Provision(root_.Path() / "env", Deps({"slow-package"}));

    EXPECT_EQ(result.kind, ErrorKind::kInstallTimeout);
    EXPECT_EQ(result.message, "Failed to install dependencies: timed out after 1s");
}

TEST_F(ProvisionerTest, MissingToolIsCreationFailure) {
    config_.environments.uv_command = "pyexec-missing-uv";
    EnvironmentProvisioner provisioner(config_);

    const auto result = provisioner.Provision(root_.Path() / "env", Deps({}));

    EXPECT_EQ(result.kind, ErrorKind::kCreationFailed);
    EXPECT_NE(result.message.find("pyexec-missing-uv"), std::string::npos);
}

}  // namespace
}  // namespace pyexec::environment
