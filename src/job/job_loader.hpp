#pragma once

#include <filesystem>

#include "job/job_types.hpp"
#include "nlohmann/json.hpp"

namespace abstruse::job {

JobRequest ParseJobRequest(const nlohmann::json& data);
JobRequest LoadJobFile(const std::filesystem::path& path);

}  // namespace abstruse::job
