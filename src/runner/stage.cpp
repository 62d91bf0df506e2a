#include "runner/stage.hpp"

#include <utility>

#include "runner/errors.hpp"

namespace abstruse::runner {

template <typename Fn>
void Stage::Guard(Fn&& fn) {
    try {
        fn();
    } catch (const std::exception&) {
        Fail(std::current_exception());
    }
}

Stage::~Stage() {
    Detach();
}

void Stage::Start(OutputHandler on_output, DoneHandler on_done) {
    if (started_) {
        throw RunnerError("stage '" + Describe() + "' already started");
    }
    started_ = true;
    on_output_ = std::move(on_output);
    on_done_ = std::move(on_done);
    Guard([this] { Run(); });
}

void Stage::Cancel() {
    if (finished_) {
        return;
    }
    finished_ = true;
    if (channel_) {
        channel_->Kill();
    }
    Detach();
    on_output_ = {};
    on_done_ = {};
}

void Stage::HandleData(const std::string&) {}

void Stage::Emit(OutputType type, std::string data) {
    if (finished_ || !on_output_) {
        return;
    }
    auto handler = on_output_;
    handler(ProcessOutput{type, std::move(data)});
}

void Stage::Complete() {
    Finish(nullptr);
}

void Stage::Fail(std::exception_ptr error) {
    Finish(std::move(error));
}

void Stage::Attach(std::shared_ptr<process::ControlChannel> channel) {
    Detach();
    channel_ = std::move(channel);
    channel_->OnData([this](const std::string& chunk) {
        if (!finished_) {
            Guard([&] { HandleData(chunk); });
        }
    });
    channel_->OnExit([this](int exit_code) {
        if (!finished_) {
            Guard([&] { HandleExit(exit_code); });
        }
    });
}

void Stage::WriteToChannel(const std::string& data) {
    if (channel_) {
        channel_->Write(data);
    }
}

void Stage::KillChannel() {
    if (channel_) {
        channel_->Kill();
    }
}

void Stage::Detach() {
    if (!channel_) {
        return;
    }
    channel_->OnData({});
    channel_->OnExit({});
    channel_.reset();
}

void Stage::Finish(std::exception_ptr error) {
    if (finished_) {
        return;
    }
    finished_ = true;
    Detach();
    auto on_done = std::move(on_done_);
    on_output_ = {};
    if (on_done) {
        on_done(std::move(error));
    }
}

}  // namespace abstruse::runner
