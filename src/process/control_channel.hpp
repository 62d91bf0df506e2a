#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace abstruse::process {

// Handle to one running container-runtime invocation. Handlers run on the
// event loop, never from inside Spawn, Write or Kill. Replacing a handler
// from within a handler is allowed; passing an empty function detaches.
class ControlChannel {
public:
    using DataHandler = std::function<void(const std::string&)>;
    using ExitHandler = std::function<void(int)>;

    virtual ~ControlChannel() = default;
    virtual void Write(const std::string& data) = 0;
    virtual void OnData(DataHandler handler) = 0;
    virtual void OnExit(ExitHandler handler) = 0;
    virtual void Kill() = 0;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    // Launches the container runtime with `args` (subcommand first).
    // Throws runner::SpawnError if the runtime cannot be started.
    virtual std::shared_ptr<ControlChannel> Spawn(const std::vector<std::string>& args) = 0;
};

}  // namespace abstruse::process
