#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "config/config_loader.hpp"
#include "container/container_manager.hpp"
#include "job/job_loader.hpp"
#include "nlohmann/json.hpp"
#include "process/pty_process_runner.hpp"
#include "runner/build_pipeline.hpp"
#include "runner/errors.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitSucceeded = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

struct RunOptions {
    std::string job_path;
    std::string image;
    std::vector<std::string> env;
    std::optional<std::string> config_path;
    bool json = false;
};

void PrintUsage() {
    std::cout << "Usage: abstruse_runner run <job.json> [--image IMAGE] [--env KEY=VALUE]... [--json] [--config PATH]\n"
              << "       abstruse_runner name <build_id> <job_id>\n"
              << "       abstruse_runner stop <build_id> <job_id>" << std::endl;
}

abstruse::config::Config LoadConfiguredConfig(const std::optional<std::string>& path) {
    auto config = path ? abstruse::config::LoadConfig(*path) : abstruse::config::LoadConfig();
    abstruse::utils::LogConfig log_config{};
    log_config.min_level = abstruse::utils::LogLevelFromString(config.log.level);
    abstruse::utils::SetLogConfig(log_config);
    return config;
}

void PrintOutput(const abstruse::runner::ProcessOutput& output, bool json) {
    if (json) {
        nlohmann::json line = {
            {"type", abstruse::runner::ToString(output.type)},
            {"data", output.data}
        };
        std::cout << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return;
    }
    switch (output.type) {
        case abstruse::runner::OutputType::Data:
            std::cout << output.data << std::flush;
            break;
        case abstruse::runner::OutputType::Exit:
            std::cout << "\n[exit] " << output.data << std::endl;
            break;
        case abstruse::runner::OutputType::Container:
            std::cout << "[container] " << output.data << std::endl;
            break;
        case abstruse::runner::OutputType::ExposedPort:
            std::cout << "[port] " << output.data << std::endl;
            break;
    }
}

std::optional<RunOptions> ParseRunOptions(int argc, char** argv) {
    RunOptions options;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--image" && has_value) {
            options.image = argv[++i];
        } else if (arg == "--env" && has_value) {
            options.env.push_back(argv[++i]);
        } else if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--json") {
            options.json = true;
        } else if (options.job_path.empty() && arg.rfind("--", 0) != 0) {
            options.job_path = arg;
        } else {
            std::cerr << "[cli] unexpected argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    if (options.job_path.empty()) {
        return std::nullopt;
    }
    return options;
}

std::optional<std::pair<int, int>> ParseIds(int argc, char** argv) {
    if (argc != 4) {
        return std::nullopt;
    }
    try {
        return std::make_pair(std::stoi(argv[2]), std::stoi(argv[3]));
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

int RunJob(const RunOptions& options) {
    const auto config = LoadConfiguredConfig(options.config_path);

    abstruse::job::JobRequest request;
    try {
        request = abstruse::job::LoadJobFile(options.job_path);
    } catch (const abstruse::job::JobFormatError& ex) {
        abstruse::utils::LogError("cli", ex.what());
        return kExitUsage;
    }

    const auto image = options.image.empty() ? request.image : options.image;
    if (image.empty()) {
        abstruse::utils::LogError("cli", "no image given (job file 'image' or --image)");
        return kExitUsage;
    }

    auto variables = config.runner.variables;
    variables.insert(variables.end(), options.env.begin(), options.env.end());

    boost::asio::io_context io;
    abstruse::process::PtyProcessRunner runner(io, config.runner.runtime_binary);
    abstruse::runner::BuildPipeline pipeline(
        runner,
        config.runner,
        request.process,
        image,
        variables,
        request.credentials);

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&pipeline](const boost::system::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        abstruse::utils::LogInfo("cli", "signal " + std::to_string(signal) + ", cancelling " +
                                            pipeline.ContainerName());
        pipeline.Cancel();
    });

    abstruse::runner::RunOutcome outcome{};
    pipeline.Run(
        [&options](const abstruse::runner::ProcessOutput& output) {
            PrintOutput(output, options.json);
        },
        [&outcome, &signals](const abstruse::runner::RunOutcome& result) {
            outcome = result;
            boost::system::error_code ignored;
            signals.cancel(ignored);
        });
    io.run();

    switch (outcome.status) {
        case abstruse::runner::RunStatus::Succeeded:
            return kExitSucceeded;
        case abstruse::runner::RunStatus::Failed:
            return kExitFailed;
        case abstruse::runner::RunStatus::Cancelled:
            return kExitCancelled;
    }
    return kExitFailed;
}

int StopSandbox(int build_id, int job_id) {
    const auto config = LoadConfiguredConfig(std::nullopt);
    const auto name = abstruse::container::SandboxName(config.runner.container_prefix, build_id, job_id);

    boost::asio::io_context io;
    abstruse::process::PtyProcessRunner runner(io, config.runner.runtime_binary);
    abstruse::container::ContainerManager containers(runner);
    auto stage = containers.StopContainer(name);
    stage->Start(
        [](const abstruse::runner::ProcessOutput& output) { PrintOutput(output, false); },
        [](std::exception_ptr) {});
    io.run();
    return kExitSucceeded;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "run") {
        const auto options = ParseRunOptions(argc, argv);
        if (!options) {
            PrintUsage();
            return kExitUsage;
        }
        try {
            return RunJob(*options);
        } catch (const abstruse::runner::RunnerError& ex) {
            abstruse::utils::LogError("cli", ex.what());
            return kExitFailed;
        }
    }

    if (argc >= 2 && (std::string(argv[1]) == "name" || std::string(argv[1]) == "stop")) {
        const auto ids = ParseIds(argc, argv);
        if (!ids) {
            PrintUsage();
            return kExitUsage;
        }
        if (std::string(argv[1]) == "stop") {
            return StopSandbox(ids->first, ids->second);
        }
        const auto config = LoadConfiguredConfig(std::nullopt);
        std::cout << abstruse::container::SandboxName(config.runner.container_prefix, ids->first, ids->second)
                  << std::endl;
        return kExitSucceeded;
    }

    PrintUsage();
    return kExitUsage;
}
