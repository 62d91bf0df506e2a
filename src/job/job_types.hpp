#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace abstruse::job {

enum class CommandType {
    Git,
    BeforeInstall,
    Install,
    BeforeScript,
    Script,
    AfterSuccess,
    AfterFailure,
    BeforeDeploy,
    Deploy,
    AfterDeploy,
    AfterScript
};

struct Command {
    CommandType type = CommandType::Script;
    std::string command;
};

struct JobProcess {
    int build_id = 0;
    int job_id = 0;
    std::vector<Command> commands;
    // KEY=VALUE assignments.
    std::vector<std::string> env;
    bool ssh_and_vnc = false;
};

struct RepositoryCredentials {
    std::string clone_url;
    std::string username;
    std::string password;
};

struct JobRequest {
    JobProcess process;
    std::string image;
    std::optional<RepositoryCredentials> credentials;
};

class JobFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string CommandTypeToString(CommandType type);
// Throws JobFormatError for an unknown name.
CommandType CommandTypeFromString(const std::string& value);

}  // namespace abstruse::job
