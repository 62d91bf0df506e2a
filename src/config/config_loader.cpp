#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace abstruse::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("runner") && data["runner"].is_object()) {
        const auto& runner = data["runner"];
        ApplyString(config.runner.runtime_binary, runner, "runtimeBinary");
        ApplyString(config.runner.container_prefix, runner, "containerPrefix");
        ApplyString(config.runner.wrapper_path, runner, "wrapperPath");
        ApplyString(config.runner.detach_key, runner, "detachKey");
        ApplyString(config.runner.netrc_path, runner, "netrcPath");
        if (runner.contains("variables") && runner["variables"].is_array()) {
            config.runner.variables.clear();
            for (const auto& item : runner["variables"]) {
                if (item.is_string()) {
                    config.runner.variables.push_back(item.get<std::string>());
                }
            }
        }
    }

    if (data.contains("log") && data["log"].is_object()) {
        ApplyString(config.log.level, data["log"], "level");
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".abstruse" / "config.json";
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "ignoring " + path.string() + ": " + ex.what());
        }
    }

    const auto runtime_binary = GetEnv("ABSTRUSE_RUNNER__RUNTIME_BINARY");
    if (!runtime_binary.empty()) {
        config.runner.runtime_binary = runtime_binary;
    }

    const auto container_prefix = GetEnv("ABSTRUSE_RUNNER__CONTAINER_PREFIX");
    if (!container_prefix.empty()) {
        config.runner.container_prefix = container_prefix;
    }

    const auto wrapper_path = GetEnv("ABSTRUSE_RUNNER__WRAPPER_PATH");
    if (!wrapper_path.empty()) {
        config.runner.wrapper_path = wrapper_path;
    }

    const auto detach_key = GetEnv("ABSTRUSE_RUNNER__DETACH_KEY");
    if (!detach_key.empty()) {
        config.runner.detach_key = detach_key;
    }

    const auto netrc_path = GetEnv("ABSTRUSE_RUNNER__NETRC_PATH");
    if (!netrc_path.empty()) {
        config.runner.netrc_path = netrc_path;
    }

    const auto variables = GetEnv("ABSTRUSE_RUNNER__VARIABLES");
    if (!variables.empty()) {
        config.runner.variables = utils::Split(variables, ',');
    }

    const auto log_level = GetEnv("ABSTRUSE_LOG__LEVEL");
    if (!log_level.empty()) {
        config.log.level = log_level;
    }

    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace abstruse::config
