#pragma once

#include <string>
#include <vector>

namespace abstruse::config {

struct RunnerConfig {
    std::string runtime_binary = "docker";
    std::string container_prefix = "abstruse";
    std::string wrapper_path = "/usr/bin/abstruse";
    std::string detach_key = "D";
    std::string netrc_path = "/home/abstruse/.netrc";
    // Injected into every sandbox after the job's own env.
    std::vector<std::string> variables;
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    RunnerConfig runner;
    LogSettings log;
};

}  // namespace abstruse::config
