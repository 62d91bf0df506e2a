#pragma once

#include <stdexcept>
#include <string>

namespace abstruse::runner {

class RunnerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The runtime refused to launch the sandbox.
class ContainerStartError : public RunnerError {
public:
    explicit ContainerStartError(int exit_code)
        : RunnerError("Error starting container (" + std::to_string(exit_code) + ")")
        , exit_code_(exit_code) {}

    int ExitCode() const { return exit_code_; }

private:
    int exit_code_;
};

// The attach session ended non-zero before the success sentinel was seen.
class CommandExecutionError : public RunnerError {
public:
    CommandExecutionError(const std::string& container, int exit_code)
        : RunnerError("[" + container + "] --- Executed command returned exit code " +
                      std::to_string(exit_code))
        , exit_code_(exit_code) {}

    int ExitCode() const { return exit_code_; }

private:
    int exit_code_;
};

// The wrapper printed the error sentinel.
class ProtocolError : public RunnerError {
public:
    explicit ProtocolError(const std::string& line)
        : RunnerError(line)
        , line_(line) {}

    const std::string& Line() const { return line_; }

private:
    std::string line_;
};

class SpawnError : public RunnerError {
public:
    using RunnerError::RunnerError;
};

}  // namespace abstruse::runner
