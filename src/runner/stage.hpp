#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <string>

#include "process/control_channel.hpp"
#include "runner/process_output.hpp"

namespace abstruse::runner {

// One unit of a build pipeline. Stages are cold: nothing is spawned until
// Start(), and each stage may be started once.
class Stage {
public:
    using DoneHandler = std::function<void(std::exception_ptr)>;

    virtual ~Stage();

    virtual std::string Describe() const = 0;

    // `on_done` fires exactly once (null on success) unless Cancel() comes first.
    void Start(OutputHandler on_output, DoneHandler on_done);
    // Kills the running process. Nothing is reported afterwards.
    void Cancel();
    bool Finished() const { return finished_; }

protected:
    virtual void Run() = 0;
    virtual void HandleData(const std::string& chunk);
    virtual void HandleExit(int exit_code) = 0;

    void Emit(OutputType type, std::string data);
    void Complete();
    void Fail(std::exception_ptr error);

    // Routes the channel's callbacks to HandleData/HandleExit until the stage
    // finishes or another channel is attached.
    void Attach(std::shared_ptr<process::ControlChannel> channel);
    // No-ops once the stage has finished.
    void WriteToChannel(const std::string& data);
    void KillChannel();

private:
    void Detach();
    void Finish(std::exception_ptr error);
    template <typename Fn>
    void Guard(Fn&& fn);

    OutputHandler on_output_;
    DoneHandler on_done_;
    std::shared_ptr<process::ControlChannel> channel_;
    bool started_ = false;
    bool finished_ = false;
};

}  // namespace abstruse::runner
