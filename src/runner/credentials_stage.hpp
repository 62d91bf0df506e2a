#pragma once

#include <memory>
#include <string>

#include "job/job_types.hpp"
#include "process/control_channel.hpp"
#include "runner/stage.hpp"

namespace abstruse::runner {

// Host part of an http(s) clone URL, empty if it is not one.
std::string CloneUrlDomain(const std::string& clone_url);

// True when the credentials carry both a username and a password.
bool HasCredentials(const job::RepositoryCredentials& credentials);

// Writes a netrc entry for the repository host into the sandbox. Silent: it
// emits no events and completes whatever the exec exit status.
std::unique_ptr<Stage> SaveCredentials(
    process::ProcessRunner& runner,
    const std::string& name,
    const job::RepositoryCredentials& credentials,
    const std::string& netrc_path);

}  // namespace abstruse::runner
