#include "runner/credentials_stage.hpp"

#include <regex>
#include <utility>
#include <vector>

#include "runner/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace abstruse::runner {
namespace {

class NetrcStage : public Stage {
public:
    NetrcStage(process::ProcessRunner& runner, std::string name, std::string script)
        : runner_(runner)
        , name_(std::move(name))
        , script_(std::move(script)) {}

    std::string Describe() const override { return "netrc " + name_; }

protected:
    void Run() override {
        try {
            Attach(runner_.Spawn({"exec", name_, "sh", "-c", script_}));
        } catch (const RunnerError& ex) {
            utils::LogWarn("credentials", std::string("netrc not written: ") + ex.what());
            Complete();
        }
    }

    void HandleExit(int exit_code) override {
        if (exit_code != 0) {
            utils::LogWarn("credentials", "netrc write in " + name_ + " exited " + std::to_string(exit_code));
        } else {
            utils::LogInfo("credentials", "netrc saved in " + name_);
        }
        Complete();
    }

private:
    process::ProcessRunner& runner_;
    std::string name_;
    std::string script_;
};

// For text placed inside a single-quoted sh word.
std::string EscapeSingleQuotes(const std::string& value) {
    return utils::ReplaceAll(value, "'", "'\\''");
}

}  // namespace

std::string CloneUrlDomain(const std::string& clone_url) {
    static const std::regex kHostPattern(R"(^https?://([^/?#]+)(?:[/?#]|$))", std::regex::icase);
    std::smatch match;
    if (std::regex_search(clone_url, match, kHostPattern)) {
        return match[1].str();
    }
    return {};
}

bool HasCredentials(const job::RepositoryCredentials& credentials) {
    return !credentials.username.empty() && !credentials.password.empty();
}

std::unique_ptr<Stage> SaveCredentials(
    process::ProcessRunner& runner,
    const std::string& name,
    const job::RepositoryCredentials& credentials,
    const std::string& netrc_path) {
    const auto script = "echo 'machine " + EscapeSingleQuotes(CloneUrlDomain(credentials.clone_url)) +
                        " login " + EscapeSingleQuotes(credentials.username) +
                        " password " + EscapeSingleQuotes(credentials.password) + "' > " + netrc_path;
    return std::make_unique<NetrcStage>(runner, name, script);
}

}  // namespace abstruse::runner
