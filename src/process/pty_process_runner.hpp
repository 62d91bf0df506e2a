#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "process/control_channel.hpp"

namespace abstruse::process {

// Runs the container runtime on a pseudo-terminal so that interactive
// subcommands (attach) behave as they do in a shell.
class PtyProcessRunner : public ProcessRunner {
public:
    PtyProcessRunner(boost::asio::io_context& io, std::string runtime_binary);

    std::shared_ptr<ControlChannel> Spawn(const std::vector<std::string>& args) override;

private:
    boost::asio::io_context& io_;
    std::string runtime_binary_;
};

}  // namespace abstruse::process
