#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "config/config_loader.hpp"

namespace {

namespace fs = std::filesystem;
using abstruse::config::LoadConfig;

const char* const kEnvironment[] = {
    "ABSTRUSE_RUNNER__RUNTIME_BINARY",
    "ABSTRUSE_RUNNER__CONTAINER_PREFIX",
    "ABSTRUSE_RUNNER__WRAPPER_PATH",
    "ABSTRUSE_RUNNER__DETACH_KEY",
    "ABSTRUSE_RUNNER__NETRC_PATH",
    "ABSTRUSE_RUNNER__VARIABLES",
    "ABSTRUSE_LOG__LEVEL",
};

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ClearEnvironment();
        dir_ = fs::temp_directory_path() /
               ("abstruse_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        ClearEnvironment();
        fs::remove_all(dir_);
    }

    static void ClearEnvironment() {
        for (const auto* name : kEnvironment) {
            unsetenv(name);
        }
    }

    fs::path WriteConfig(const std::string& body) {
        const auto path = dir_ / "config.json";
        std::ofstream(path) << body;
        return path;
    }

    fs::path dir_;
};

TEST_F(ConfigLoaderTest, MissingFileYieldsDefaults) {
    const auto config = LoadConfig(dir_ / "absent.json");

    EXPECT_EQ("docker", config.runner.runtime_binary);
    EXPECT_EQ("abstruse", config.runner.container_prefix);
    EXPECT_EQ("/usr/bin/abstruse", config.runner.wrapper_path);
    EXPECT_EQ("D", config.runner.detach_key);
    EXPECT_EQ("/home/abstruse/.netrc", config.runner.netrc_path);
    EXPECT_TRUE(config.runner.variables.empty());
    EXPECT_EQ("info", config.log.level);
}

TEST_F(ConfigLoaderTest, ReadsRunnerAndLogSections) {
    const auto path = WriteConfig(R"({
        "runner": {
            "runtimeBinary": "podman",
            "containerPrefix": "ci",
            "detachKey": "Q",
            "variables": ["TOKEN=abc", 42, "REGION=eu"]
        },
        "log": {"level": "debug"}
    })");

    const auto config = LoadConfig(path);

    EXPECT_EQ("podman", config.runner.runtime_binary);
    EXPECT_EQ("ci", config.runner.container_prefix);
    EXPECT_EQ("Q", config.runner.detach_key);
    EXPECT_EQ("/usr/bin/abstruse", config.runner.wrapper_path);
    EXPECT_EQ((std::vector<std::string>{"TOKEN=abc", "REGION=eu"}), config.runner.variables);
    EXPECT_EQ("debug", config.log.level);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = WriteConfig(R"({"runner": {"runtimeBinary": "podman", "variables": ["A=1"]}})");
    setenv("ABSTRUSE_RUNNER__RUNTIME_BINARY", "/opt/docker/bin/docker", 1);
    setenv("ABSTRUSE_RUNNER__VARIABLES", "B=2,,C=3", 1);
    setenv("ABSTRUSE_LOG__LEVEL", "warn", 1);

    const auto config = LoadConfig(path);

    EXPECT_EQ("/opt/docker/bin/docker", config.runner.runtime_binary);
    EXPECT_EQ((std::vector<std::string>{"B=2", "C=3"}), config.runner.variables);
    EXPECT_EQ("warn", config.log.level);
}

TEST_F(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    const auto path = WriteConfig("{\"runner\": {\"runtimeBinary\": ");

    const auto config = LoadConfig(path);

    EXPECT_EQ("docker", config.runner.runtime_binary);
    EXPECT_EQ("info", config.log.level);
}

TEST_F(ConfigLoaderTest, WrongTypesAreIgnored) {
    const auto path = WriteConfig(R"({"runner": {"containerPrefix": 7, "variables": "A=1"}, "log": []})");

    const auto config = LoadConfig(path);

    EXPECT_EQ("abstruse", config.runner.container_prefix);
    EXPECT_TRUE(config.runner.variables.empty());
    EXPECT_EQ("info", config.log.level);
}

}  // namespace
