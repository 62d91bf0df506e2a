#include "container/port_discovery.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace abstruse::container {
namespace {

class PortQueryStage : public runner::Stage {
public:
    PortQueryStage(process::ProcessRunner& runner, std::string name, int internal_port)
        : runner_(runner)
        , name_(std::move(name))
        , internal_port_(internal_port) {}

    std::string Describe() const override {
        return "port " + name_ + " " + std::to_string(internal_port_);
    }

protected:
    void Run() override {
        Attach(runner_.Spawn({"port", name_, std::to_string(internal_port_)}));
    }

    void HandleData(const std::string& chunk) override {
        if (reported_) {
            return;
        }
        const auto host_port = ParseHostPort(chunk);
        if (!host_port) {
            return;
        }
        reported_ = true;
        utils::LogInfo("port", name_ + " " + std::to_string(internal_port_) + " -> " + *host_port);
        Emit(runner::OutputType::ExposedPort, std::to_string(internal_port_) + ":" + *host_port);
    }

    void HandleExit(int exit_code) override {
        if (!reported_) {
            utils::LogDebug("port", "no binding for " + name_ + ":" + std::to_string(internal_port_) +
                                        " (exit " + std::to_string(exit_code) + ")");
        }
        Complete();
    }

private:
    process::ProcessRunner& runner_;
    std::string name_;
    int internal_port_;
    bool reported_ = false;
};

}  // namespace

std::optional<std::string> ParseHostPort(const std::string& output) {
    for (auto line : utils::Split(output, '\n')) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto colon = line.rfind(':');
        if (colon == std::string::npos || colon + 1 == line.size()) {
            continue;
        }
        const auto port = line.substr(colon + 1);
        const bool numeric = std::all_of(port.begin(), port.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
        if (numeric) {
            return port;
        }
    }
    return std::nullopt;
}

PortDiscovery::PortDiscovery(process::ProcessRunner& runner)
    : runner_(runner) {}

std::unique_ptr<runner::Stage> PortDiscovery::ExposedPort(const std::string& name, int internal_port) {
    return std::make_unique<PortQueryStage>(runner_, name, internal_port);
}

}  // namespace abstruse::container
