#include "runner/build_pipeline.hpp"

#include <utility>

#include "runner/credentials_stage.hpp"
#include "runner/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace abstruse::runner {
namespace {

// BuildStages always puts the container start first.
constexpr std::size_t kStartStage = 0;

constexpr int kSshPort = 22;
constexpr int kVncPort = 5900;

constexpr const char* kSshCommand = "sudo /etc/init.d/ssh start";
constexpr const char* kXvfbCommand =
    "export DISPLAY=:99 && "
    "sudo /etc/init.d/xvfb start && "
    "sleep 3 && "
    "sudo /etc/init.d/openbox start";
constexpr const char* kVncCommand =
    "x11vnc -xkb -noxrecord -noxfixes -noxdamage "
    "-display :99 -forever -bg -rfbauth /etc/x11vnc.pass "
    "-rfbport 5900";

constexpr const char* kExportPrefix = "export ";

std::string DescribeError(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& ex) {
        return ex.what();
    }
}

DriverOptions MakeDriverOptions(const config::RunnerConfig& config) {
    DriverOptions options;
    options.wrapper_path = config.wrapper_path;
    options.detach_key = config.detach_key;
    return options;
}

}  // namespace

BuildPipeline::BuildPipeline(process::ProcessRunner& runner,
                             const config::RunnerConfig& config,
                             job::JobProcess process,
                             std::string image,
                             std::vector<std::string> variables,
                             std::optional<job::RepositoryCredentials> credentials)
    : runner_(runner)
    , containers_(runner)
    , ports_(runner)
    , driver_(runner, MakeDriverOptions(config))
    , process_(std::move(process))
    , image_(std::move(image))
    , variables_(std::move(variables))
    , credentials_(std::move(credentials))
    , netrc_path_(config.netrc_path)
    , name_(container::SandboxName(config.container_prefix, process_.build_id, process_.job_id)) {
    BuildStages();
}

BuildPipeline::~BuildPipeline() {
    if (state_ != State::kRunning) {
        return;
    }
    utils::LogWarn("pipeline", name_ + " destroyed while running, removing sandbox");
    if (current_ < stages_.size()) {
        stages_[current_]->Cancel();
    }
    try {
        runner_.Spawn(container::ContainerManager::RemoveArguments(name_));
    } catch (const RunnerError& ex) {
        utils::LogError("pipeline", "could not remove " + name_ + ": " + ex.what());
    }
}

std::vector<std::string> BuildPipeline::EnvironmentArguments(
    const job::JobProcess& process,
    const std::vector<std::string>& variables) {
    std::vector<std::string> args;
    for (const auto& command : process.commands) {
        if (!utils::StartsWith(command.command, kExportPrefix)) {
            continue;
        }
        const auto assignments = command.command.substr(std::string(kExportPrefix).size());
        for (const auto& assignment : utils::Split(assignments, ' ')) {
            args.push_back("-e");
            args.push_back(assignment);
        }
    }
    for (const auto& entry : process.env) {
        args.push_back("-e");
        args.push_back(entry);
    }
    for (const auto& entry : variables) {
        args.push_back("-e");
        args.push_back(entry);
    }
    return args;
}

std::vector<std::string> BuildPipeline::StageNames() const {
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_) {
        names.push_back(stage->Describe());
    }
    return names;
}

void BuildPipeline::BuildStages() {
    stages_.push_back(containers_.StartContainer(
        name_, image_, EnvironmentArguments(process_, variables_)));
    if (credentials_ && HasCredentials(*credentials_)) {
        stages_.push_back(SaveCredentials(runner_, name_, *credentials_, netrc_path_));
    }
    if (process_.ssh_and_vnc) {
        AppendDebugStages();
    }
    for (const auto& command : process_.commands) {
        stages_.push_back(driver_.Execute(name_, command));
    }
}

void BuildPipeline::AppendDebugStages() {
    stages_.push_back(driver_.Execute(name_, {job::CommandType::BeforeInstall, kSshCommand}));
    stages_.push_back(ports_.ExposedPort(name_, kSshPort));
    stages_.push_back(driver_.Execute(name_, {job::CommandType::BeforeInstall, kXvfbCommand}));
    stages_.push_back(driver_.Execute(name_, {job::CommandType::BeforeInstall, kVncCommand}));
    stages_.push_back(ports_.ExposedPort(name_, kVncPort));
}

void BuildPipeline::Run(OutputHandler on_output, FinishHandler on_finish) {
    if (state_ != State::kIdle) {
        utils::LogWarn("pipeline", name_ + " already started");
        return;
    }
    on_output_ = std::move(on_output);
    on_finish_ = std::move(on_finish);
    if (cancel_requested_) {
        outcome_ = RunOutcome{RunStatus::Cancelled, "cancelled before start"};
        Finish();
        return;
    }
    utils::LogInfo("pipeline", name_ + " running " + std::to_string(stages_.size()) + " stages");
    state_ = State::kRunning;
    current_ = 0;
    StartNext();
}

void BuildPipeline::Cancel() {
    if (state_ == State::kIdle) {
        cancel_requested_ = true;
        return;
    }
    if (state_ != State::kRunning || cancel_requested_) {
        return;
    }
    cancel_requested_ = true;
    outcome_ = RunOutcome{RunStatus::Cancelled, "cancelled"};
    if (current_ == kStartStage) {
        // Killing the runtime client mid-launch can leave a container the
        // teardown's rm -f never sees. Tear down once the launch has settled.
        utils::LogInfo("pipeline", name_ + " cancelled, waiting for container start to settle");
        return;
    }
    utils::LogInfo("pipeline", name_ + " cancelled");
    stages_[current_]->Cancel();
    Teardown();
}

void BuildPipeline::StartNext() {
    if (current_ >= stages_.size()) {
        outcome_ = RunOutcome{RunStatus::Succeeded, {}};
        Teardown();
        return;
    }
    auto& stage = *stages_[current_];
    utils::LogDebug("pipeline", name_ + " stage " + std::to_string(current_ + 1) + "/" +
                                    std::to_string(stages_.size()) + ": " + stage.Describe());
    stage.Start(
        [this](const ProcessOutput& output) { Forward(output); },
        [this](std::exception_ptr error) { HandleStageDone(std::move(error)); });
}

void BuildPipeline::HandleStageDone(std::exception_ptr error) {
    if (state_ != State::kRunning) {
        return;
    }
    if (cancel_requested_) {
        Teardown();
        return;
    }
    if (error) {
        outcome_ = RunOutcome{RunStatus::Failed, DescribeError(error)};
        utils::LogWarn("pipeline", name_ + " failed at " + stages_[current_]->Describe() +
                                       ": " + outcome_.reason);
        Teardown();
        return;
    }
    ++current_;
    StartNext();
}

void BuildPipeline::Teardown() {
    state_ = State::kTearingDown;
    stop_stage_ = containers_.StopContainer(name_);
    stop_stage_->Start(
        [this](const ProcessOutput& output) { Forward(output); },
        [this](std::exception_ptr) { HandleTeardownDone(); });
}

void BuildPipeline::HandleTeardownDone() {
    if (outcome_.status == RunStatus::Failed) {
        Forward(ProcessOutput{OutputType::Data, outcome_.reason});
    }
    Finish();
}

void BuildPipeline::Finish() {
    state_ = State::kFinished;
    utils::LogInfo("pipeline", name_ + " " + ToString(outcome_.status));
    auto on_finish = std::move(on_finish_);
    on_output_ = {};
    if (on_finish) {
        on_finish(outcome_);
    }
}

void BuildPipeline::Forward(const ProcessOutput& output) {
    if (state_ == State::kFinished || !on_output_) {
        return;
    }
    auto handler = on_output_;
    handler(output);
}

}  // namespace abstruse::runner
