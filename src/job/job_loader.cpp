#include "job/job_loader.hpp"

#include <fstream>
#include <utility>

namespace abstruse::job {
namespace {

const std::pair<CommandType, const char*> kCommandTypeNames[] = {
    {CommandType::Git, "git"},
    {CommandType::BeforeInstall, "before_install"},
    {CommandType::Install, "install"},
    {CommandType::BeforeScript, "before_script"},
    {CommandType::Script, "script"},
    {CommandType::AfterSuccess, "after_success"},
    {CommandType::AfterFailure, "after_failure"},
    {CommandType::BeforeDeploy, "before_deploy"},
    {CommandType::Deploy, "deploy"},
    {CommandType::AfterDeploy, "after_deploy"},
    {CommandType::AfterScript, "after_script"},
};

int RequireInt(const nlohmann::json& data, const char* key) {
    if (!data.contains(key) || !data[key].is_number_integer()) {
        throw JobFormatError(std::string("missing integer field '") + key + "'");
    }
    return data[key].get<int>();
}

std::vector<std::string> ReadStringArray(const nlohmann::json& data, const char* key) {
    std::vector<std::string> items;
    if (!data.contains(key) || data[key].is_null()) {
        return items;
    }
    if (!data[key].is_array()) {
        throw JobFormatError(std::string("field '") + key + "' must be an array");
    }
    for (const auto& item : data[key]) {
        if (!item.is_string()) {
            throw JobFormatError(std::string("field '") + key + "' must contain strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

Command ParseCommand(const nlohmann::json& entry) {
    if (!entry.is_object()) {
        throw JobFormatError("command entries must be objects");
    }
    if (!entry.contains("command") || !entry["command"].is_string()) {
        throw JobFormatError("command entry without 'command' text");
    }
    Command command{};
    command.command = entry["command"].get<std::string>();
    if (entry.contains("type")) {
        if (!entry["type"].is_string()) {
            throw JobFormatError("command 'type' must be a string");
        }
        command.type = CommandTypeFromString(entry["type"].get<std::string>());
    }
    return command;
}

}  // namespace

std::string CommandTypeToString(CommandType type) {
    for (const auto& [value, name] : kCommandTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "script";
}

CommandType CommandTypeFromString(const std::string& value) {
    for (const auto& [type, name] : kCommandTypeNames) {
        if (value == name) {
            return type;
        }
    }
    throw JobFormatError("unknown command type '" + value + "'");
}

JobRequest ParseJobRequest(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw JobFormatError("job must be a JSON object");
    }

    JobRequest request{};
    request.process.build_id = RequireInt(data, "build_id");
    request.process.job_id = RequireInt(data, "job_id");
    request.process.env = ReadStringArray(data, "env");
    if (data.contains("sshAndVnc") && data["sshAndVnc"].is_boolean()) {
        request.process.ssh_and_vnc = data["sshAndVnc"].get<bool>();
    }
    if (data.contains("commands")) {
        if (!data["commands"].is_array()) {
            throw JobFormatError("field 'commands' must be an array");
        }
        for (const auto& entry : data["commands"]) {
            request.process.commands.push_back(ParseCommand(entry));
        }
    }
    request.image = data.value("image", "");

    if (data.contains("repository") && data["repository"].is_object()) {
        const auto& repository = data["repository"];
        RepositoryCredentials credentials{};
        credentials.clone_url = repository.value("clone_url", "");
        credentials.username = repository.value("username", "");
        credentials.password = repository.value("password", "");
        request.credentials = credentials;
    }
    return request;
}

JobRequest LoadJobFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw JobFormatError("cannot open job file " + path.string());
    }
    try {
        nlohmann::json data;
        input >> data;
        return ParseJobRequest(data);
    } catch (const nlohmann::json::exception& ex) {
        throw JobFormatError("invalid job file " + path.string() + ": " + ex.what());
    }
}

}  // namespace abstruse::job
