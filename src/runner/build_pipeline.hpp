#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "container/container_manager.hpp"
#include "container/port_discovery.hpp"
#include "job/job_types.hpp"
#include "process/control_channel.hpp"
#include "runner/command_driver.hpp"
#include "runner/process_output.hpp"
#include "runner/stage.hpp"

namespace abstruse::runner {

// Runs one job as a single ordered event stream:
//   start -> [netrc] -> [ssh, port 22, xvfb, vnc, port 5900] -> commands -> stop
// Stages run strictly one after another. The first failure abandons the
// remaining stages. The stop stage runs exactly once, last, on every path:
// success, failure and Cancel().
class BuildPipeline {
public:
    using FinishHandler = std::function<void(const RunOutcome&)>;

    BuildPipeline(process::ProcessRunner& runner,
                  const config::RunnerConfig& config,
                  job::JobProcess process,
                  std::string image,
                  std::vector<std::string> variables,
                  std::optional<job::RepositoryCredentials> credentials = std::nullopt);

    // Destroying a running pipeline kills the active stage and fires off
    // `rm -f` for the sandbox without waiting for it. A stop already in
    // flight keeps running on its own.
    ~BuildPipeline();

    BuildPipeline(const BuildPipeline&) = delete;
    BuildPipeline& operator=(const BuildPipeline&) = delete;

    void Run(OutputHandler on_output, FinishHandler on_finish);
    // Stops the active stage and tears the sandbox down. A container start in
    // progress is allowed to finish first. Ignored once the teardown has begun.
    void Cancel();

    bool Finished() const { return state_ == State::kFinished; }
    const std::string& ContainerName() const { return name_; }
    std::vector<std::string> StageNames() const;

    // `-e` arguments from export commands, then job env, then `variables`.
    static std::vector<std::string> EnvironmentArguments(
        const job::JobProcess& process,
        const std::vector<std::string>& variables);

private:
    enum class State {
        kIdle,
        kRunning,
        kTearingDown,
        kFinished
    };

    void BuildStages();
    void AppendDebugStages();
    void StartNext();
    void HandleStageDone(std::exception_ptr error);
    void Teardown();
    void HandleTeardownDone();
    void Finish();
    void Forward(const ProcessOutput& output);

    process::ProcessRunner& runner_;
    container::ContainerManager containers_;
    container::PortDiscovery ports_;
    CommandDriver driver_;
    job::JobProcess process_;
    std::string image_;
    std::vector<std::string> variables_;
    std::optional<job::RepositoryCredentials> credentials_;
    std::string netrc_path_;
    std::string name_;

    std::vector<std::unique_ptr<Stage>> stages_;
    std::size_t current_ = 0;
    std::unique_ptr<Stage> stop_stage_;
    State state_ = State::kIdle;
    bool cancel_requested_ = false;
    RunOutcome outcome_;
    OutputHandler on_output_;
    FinishHandler on_finish_;
};

}  // namespace abstruse::runner
