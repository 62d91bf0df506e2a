#include "runner/command_driver.hpp"

#include <utility>

#include "runner/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace abstruse::runner {
namespace {

class AttachStage : public Stage {
public:
    AttachStage(process::ProcessRunner& runner,
                const DriverOptions& options,
                std::string name,
                job::Command command)
        : runner_(runner)
        , options_(options)
        , name_(std::move(name))
        , command_(std::move(command)) {}

    std::string Describe() const override {
        return "exec " + name_ + " '" + command_.command + "'";
    }

protected:
    void Run() override {
        state_ = State::kAttaching;
        Attach(runner_.Spawn({"attach", "--detach-keys=" + options_.detach_key, name_}));
        state_ = State::kAwaitingFirstPrompt;
    }

    void HandleData(const std::string& chunk) override {
        switch (state_) {
            case State::kAwaitingFirstPrompt:
                Dispatch();
                return;
            case State::kRunning:
                Classify(chunk);
                return;
            default:
                return;
        }
    }

    void HandleExit(int exit_code) override {
        const auto previous = state_;
        state_ = State::kClosed;
        if (previous == State::kFailed) {
            return;
        }
        if (exit_code != 0 && !success_) {
            utils::LogWarn("driver", name_ + " attach exited " + std::to_string(exit_code) +
                                         " without success sentinel");
            Fail(std::make_exception_ptr(CommandExecutionError(name_, exit_code)));
            return;
        }
        Emit(OutputType::Exit, "0");
        Complete();
    }

private:
    enum class State {
        kAttaching,
        kAwaitingFirstPrompt,
        kRunning,
        kDetaching,
        kFailed,
        kClosed
    };

    void Dispatch() {
        state_ = State::kRunning;
        utils::LogDebug("driver", name_ + " <- " + command_.command);
        WriteToChannel(CommandDriver::WrapCommand(options_.wrapper_path, command_.command));
        Emit(OutputType::Data, "==> " + command_.command + "\r");
    }

    void Classify(const std::string& chunk) {
        if (utils::Contains(chunk, kSuccessSentinel)) {
            success_ = true;
            state_ = State::kDetaching;
            if (command_.type == job::CommandType::Script) {
                Emit(OutputType::Data, CommandDriver::StripLineNoise(chunk));
            }
            WriteToChannel(options_.detach_key);
            return;
        }
        if (utils::Contains(chunk, kErrorSentinel)) {
            state_ = State::kFailed;
            const auto line = CommandDriver::StripLineNoise(chunk);
            utils::LogWarn("driver", name_ + " reported error: " + line);
            KillChannel();
            Fail(std::make_exception_ptr(ProtocolError(line)));
            return;
        }
        if (!CommandDriver::IsNoise(chunk, options_.wrapper_path)) {
            Emit(OutputType::Data, CommandDriver::StripPrompt(chunk));
        }
    }

    process::ProcessRunner& runner_;
    DriverOptions options_;
    std::string name_;
    job::Command command_;
    State state_ = State::kAttaching;
    bool success_ = false;
};

}  // namespace

CommandDriver::CommandDriver(process::ProcessRunner& runner, DriverOptions options)
    : runner_(runner)
    , options_(std::move(options)) {}

std::unique_ptr<Stage> CommandDriver::Execute(const std::string& name, job::Command command) {
    return std::make_unique<AttachStage>(runner_, options_, name, std::move(command));
}

std::string CommandDriver::WrapCommand(const std::string& wrapper_path, const std::string& command) {
    return wrapper_path + " '" + command + "'\r";
}

bool CommandDriver::IsNoise(const std::string& chunk, const std::string& wrapper_path) {
    return utils::Contains(chunk, wrapper_path) ||
           utils::Contains(chunk, "exit $?") ||
           utils::Contains(chunk, "logout") ||
           utils::Contains(chunk, "read escape sequence");
}

std::string CommandDriver::StripLineNoise(const std::string& chunk) {
    return utils::EraseAll(chunk, "\n\r");
}

std::string CommandDriver::StripPrompt(const std::string& chunk) {
    auto result = chunk;
    const auto pos = result.find("> ");
    if (pos != std::string::npos) {
        result.erase(pos, 2);
    }
    return result;
}

}  // namespace abstruse::runner
