#pragma once

#include <memory>
#include <optional>
#include <string>

#include "process/control_channel.hpp"
#include "runner/stage.hpp"

namespace abstruse::container {

// Host port from one line of `port` output ("0.0.0.0:32768").
std::optional<std::string> ParseHostPort(const std::string& output);

class PortDiscovery {
public:
    explicit PortDiscovery(process::ProcessRunner& runner);

    // Emits one exposedPort event "<internal>:<host>" when a binding is
    // published. Completes on exit without an event otherwise.
    std::unique_ptr<runner::Stage> ExposedPort(const std::string& name, int internal_port);

private:
    process::ProcessRunner& runner_;
};

}  // namespace abstruse::container
