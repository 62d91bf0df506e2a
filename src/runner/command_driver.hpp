#pragma once

#include <memory>
#include <string>

#include "job/job_types.hpp"
#include "process/control_channel.hpp"
#include "runner/stage.hpp"

namespace abstruse::runner {

inline constexpr const char* kSuccessSentinel = "[success]";
inline constexpr const char* kErrorSentinel = "[error]";

struct DriverOptions {
    std::string wrapper_path = "/usr/bin/abstruse";
    std::string detach_key = "D";
};

// Runs one command inside a sandbox by typing it into an `attach` session
// and watching the terminal output for the wrapper's sentinels.
//
// Outcome is decided by substring match on raw output chunks: a chunk
// containing "[success]" succeeds the command, one containing "[error]"
// kills the session and fails it. Legitimate output that happens to contain
// either sentinel is misclassified the same way.
class CommandDriver {
public:
    CommandDriver(process::ProcessRunner& runner, DriverOptions options);

    std::unique_ptr<Stage> Execute(const std::string& name, job::Command command);

    // "<wrapper> '<command>'\r"
    static std::string WrapCommand(const std::string& wrapper_path, const std::string& command);
    // Echoes and banners of the attach session that never reach the transcript.
    static bool IsNoise(const std::string& chunk, const std::string& wrapper_path);
    static std::string StripLineNoise(const std::string& chunk);
    static std::string StripPrompt(const std::string& chunk);

private:
    process::ProcessRunner& runner_;
    DriverOptions options_;
};

}  // namespace abstruse::runner
