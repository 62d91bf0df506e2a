#include "container/container_manager.hpp"

#include <utility>

#include "runner/errors.hpp"
#include "utils/logging.hpp"

namespace abstruse::container {
namespace {

constexpr const char* kMemoryLimit = "-m=2048M";
constexpr const char* kCpuLimit = "--cpus=2";

class StartContainerStage : public runner::Stage {
public:
    StartContainerStage(process::ProcessRunner& runner,
                        std::string name,
                        std::string image,
                        std::vector<std::string> extra_args)
        : runner_(runner)
        , name_(std::move(name))
        , image_(std::move(image))
        , extra_args_(std::move(extra_args)) {}

    std::string Describe() const override { return "start " + name_; }

protected:
    void Run() override {
        phase_ = Phase::kRemoving;
        Attach(runner_.Spawn(ContainerManager::RemoveArguments(name_)));
    }

    void HandleExit(int exit_code) override {
        if (phase_ == Phase::kRemoving) {
            // A missing container is the common case here.
            utils::LogDebug("container", "stale removal of " + name_ + " exited " + std::to_string(exit_code));
            phase_ = Phase::kLaunching;
            Attach(runner_.Spawn(ContainerManager::RunArguments(name_, image_, extra_args_)));
            return;
        }
        if (exit_code != 0) {
            utils::LogError("container", "failed to start " + name_ + " exit=" + std::to_string(exit_code));
            Fail(std::make_exception_ptr(runner::ContainerStartError(exit_code)));
            return;
        }
        utils::LogInfo("container", "started " + name_ + " from " + image_);
        Emit(runner::OutputType::Container, "Container " + name_ + " successfully started.");
        Complete();
    }

private:
    enum class Phase {
        kRemoving,
        kLaunching
    };

    process::ProcessRunner& runner_;
    std::string name_;
    std::string image_;
    std::vector<std::string> extra_args_;
    Phase phase_ = Phase::kRemoving;
};

class StopContainerStage : public runner::Stage {
public:
    StopContainerStage(process::ProcessRunner& runner, std::string name)
        : runner_(runner)
        , name_(std::move(name)) {}

    std::string Describe() const override { return "stop " + name_; }

protected:
    void Run() override {
        try {
            Attach(runner_.Spawn(ContainerManager::RemoveArguments(name_)));
        } catch (const runner::RunnerError& ex) {
            utils::LogWarn("container", "could not remove " + name_ + ": " + ex.what());
            Report();
        }
    }

    void HandleExit(int exit_code) override {
        if (exit_code != 0) {
            utils::LogWarn("container", "rm -f " + name_ + " exited " + std::to_string(exit_code));
        }
        Report();
    }

private:
    void Report() {
        utils::LogInfo("container", "stopped " + name_);
        Emit(runner::OutputType::Container, "Container " + name_ + " successfully stopped.");
        Complete();
    }

    process::ProcessRunner& runner_;
    std::string name_;
};

}  // namespace

std::string SandboxName(const std::string& prefix, int build_id, int job_id) {
    return prefix + "_" + std::to_string(build_id) + "_" + std::to_string(job_id);
}

ContainerManager::ContainerManager(process::ProcessRunner& runner)
    : runner_(runner) {}

std::unique_ptr<runner::Stage> ContainerManager::StartContainer(
    const std::string& name,
    const std::string& image,
    std::vector<std::string> extra_args) {
    return std::make_unique<StartContainerStage>(runner_, name, image, std::move(extra_args));
}

std::unique_ptr<runner::Stage> ContainerManager::StopContainer(const std::string& name) {
    return std::make_unique<StopContainerStage>(runner_, name);
}

std::vector<std::string> ContainerManager::RemoveArguments(const std::string& name) {
    return {"rm", "-f", name};
}

std::vector<std::string> ContainerManager::RunArguments(
    const std::string& name,
    const std::string& image,
    const std::vector<std::string>& extra_args) {
    std::vector<std::string> args = {
        "run", "-dit", "--security-opt=seccomp:unconfined", "-P", kMemoryLimit, kCpuLimit
    };
    args.insert(args.end(), extra_args.begin(), extra_args.end());
    args.push_back("--name");
    args.push_back(name);
    args.push_back(image);
    return args;
}

}  // namespace abstruse::container
