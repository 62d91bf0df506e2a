#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "job/job_loader.hpp"

namespace {

using abstruse::job::CommandType;
using abstruse::job::CommandTypeFromString;
using abstruse::job::CommandTypeToString;
using abstruse::job::JobFormatError;
using abstruse::job::LoadJobFile;
using abstruse::job::ParseJobRequest;

TEST(JobLoaderTest, ParsesFullJob) {
    const auto data = nlohmann::json::parse(R"({
        "build_id": 12,
        "job_id": 34,
        "image": "abstruse/node:10",
        "env": ["NODE_ENV=test"],
        "sshAndVnc": true,
        "commands": [
            {"type": "git", "command": "git clone https://github.com/a/b.git ."},
            {"type": "install", "command": "npm install"},
            {"command": "npm test"}
        ],
        "repository": {"clone_url": "https://github.com/a/b.git", "username": "bot", "password": "pw"}
    })");

    const auto request = ParseJobRequest(data);

    EXPECT_EQ(12, request.process.build_id);
    EXPECT_EQ(34, request.process.job_id);
    EXPECT_EQ("abstruse/node:10", request.image);
    EXPECT_TRUE(request.process.ssh_and_vnc);
    EXPECT_EQ((std::vector<std::string>{"NODE_ENV=test"}), request.process.env);
    ASSERT_EQ(3u, request.process.commands.size());
    EXPECT_EQ(CommandType::Git, request.process.commands[0].type);
    EXPECT_EQ(CommandType::Install, request.process.commands[1].type);
    EXPECT_EQ(CommandType::Script, request.process.commands[2].type);
    EXPECT_EQ("npm test", request.process.commands[2].command);
    ASSERT_TRUE(request.credentials.has_value());
    EXPECT_EQ("bot", request.credentials->username);
    EXPECT_EQ("pw", request.credentials->password);
}

TEST(JobLoaderTest, MinimalJobHasNoCommandsOrCredentials) {
    const auto request = ParseJobRequest(nlohmann::json::parse(R"({"build_id": 1, "job_id": 2})"));

    EXPECT_TRUE(request.process.commands.empty());
    EXPECT_TRUE(request.process.env.empty());
    EXPECT_FALSE(request.process.ssh_and_vnc);
    EXPECT_TRUE(request.image.empty());
    EXPECT_FALSE(request.credentials.has_value());
}

TEST(JobLoaderTest, RejectsMalformedJobs) {
    EXPECT_THROW(ParseJobRequest(nlohmann::json::parse(R"({"job_id": 2})")), JobFormatError);
    EXPECT_THROW(ParseJobRequest(nlohmann::json::parse(R"({"build_id": "1", "job_id": 2})")), JobFormatError);
    EXPECT_THROW(ParseJobRequest(nlohmann::json::parse(R"([1, 2])")), JobFormatError);
    EXPECT_THROW(ParseJobRequest(nlohmann::json::parse(
                     R"({"build_id": 1, "job_id": 2, "commands": [{"type": "compile", "command": "make"}]})")),
                 JobFormatError);
    EXPECT_THROW(ParseJobRequest(nlohmann::json::parse(
                     R"({"build_id": 1, "job_id": 2, "commands": [{"type": "script"}]})")),
                 JobFormatError);
    EXPECT_THROW(ParseJobRequest(nlohmann::json::parse(R"({"build_id": 1, "job_id": 2, "env": [1]})")),
                 JobFormatError);
}

TEST(JobLoaderTest, CommandTypeNamesRoundTrip) {
    EXPECT_EQ("before_install", CommandTypeToString(CommandType::BeforeInstall));
    EXPECT_EQ("after_script", CommandTypeToString(CommandType::AfterScript));
    EXPECT_EQ(CommandType::Deploy, CommandTypeFromString("deploy"));
    EXPECT_THROW(CommandTypeFromString("Script"), JobFormatError);
}

TEST(JobLoaderTest, LoadJobFileReportsUnreadableAndInvalidFiles) {
    const auto dir = std::filesystem::temp_directory_path() / "abstruse_job_loader_test";
    std::filesystem::create_directories(dir);

    EXPECT_THROW(LoadJobFile(dir / "missing.json"), JobFormatError);

    const auto broken = dir / "broken.json";
    std::ofstream(broken) << "{\"build_id\": 1,";
    EXPECT_THROW(LoadJobFile(broken), JobFormatError);

    const auto valid = dir / "job.json";
    std::ofstream(valid) << R"({"build_id": 5, "job_id": 6, "commands": [{"command": "make"}]})";
    const auto request = LoadJobFile(valid);
    EXPECT_EQ(5, request.process.build_id);
    ASSERT_EQ(1u, request.process.commands.size());

    std::filesystem::remove_all(dir);
}

}  // namespace
