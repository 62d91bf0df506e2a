#pragma once

#include <functional>
#include <string>

namespace abstruse::runner {

enum class OutputType {
    Data,
    Exit,
    Container,
    ExposedPort
};

inline const char* ToString(OutputType type) {
    switch (type) {
        case OutputType::Data: return "data";
        case OutputType::Exit: return "exit";
        case OutputType::Container: return "container";
        case OutputType::ExposedPort: return "exposedPort";
    }
    return "data";
}

struct ProcessOutput {
    OutputType type = OutputType::Data;
    std::string data;
};

using OutputHandler = std::function<void(const ProcessOutput&)>;

enum class RunStatus {
    Succeeded,
    Failed,
    Cancelled
};

inline const char* ToString(RunStatus status) {
    switch (status) {
        case RunStatus::Succeeded: return "succeeded";
        case RunStatus::Failed: return "failed";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

struct RunOutcome {
    RunStatus status = RunStatus::Succeeded;
    std::string reason;
};

}  // namespace abstruse::runner
