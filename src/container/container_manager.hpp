#pragma once

#include <memory>
#include <string>
#include <vector>

#include "process/control_channel.hpp"
#include "runner/stage.hpp"

namespace abstruse::container {

// `<prefix>_<build_id>_<job_id>`. The same pair always maps to the same
// sandbox, which is what makes StartContainer idempotent.
std::string SandboxName(const std::string& prefix, int build_id, int job_id);

class ContainerManager {
public:
    explicit ContainerManager(process::ProcessRunner& runner);

    // Force-removes any container called `name`, then launches a fresh one.
    // Emits one container event; fails with ContainerStartError.
    std::unique_ptr<runner::Stage> StartContainer(
        const std::string& name,
        const std::string& image,
        std::vector<std::string> extra_args);

    // Force-removes `name`. Always emits one container event and completes.
    std::unique_ptr<runner::Stage> StopContainer(const std::string& name);

    static std::vector<std::string> RemoveArguments(const std::string& name);
    static std::vector<std::string> RunArguments(
        const std::string& name,
        const std::string& image,
        const std::vector<std::string>& extra_args);

private:
    process::ProcessRunner& runner_;
};

}  // namespace abstruse::container
