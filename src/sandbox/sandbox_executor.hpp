#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "jobs/job_types.hpp"
#include "utils/common.hpp"

namespace playrun::sandbox {

struct RunOutcome {
    jobs::JobStatus status = jobs::JobStatus::kError;
    int exit_code = -1;
    std::string explanation;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual RunOutcome Run(const jobs::UnifiedJob& job,
                           const std::vector<std::string>& args,
                           const std::string& cwd,
                           const utils::EnvMap& env,
                           const jobs::PasswordPromptMap& passwords,
                           const jobs::OutputSink& sink) = 0;
};

// Returns true once the job with the given id has been asked to cancel.
using CancelProbe = std::function<bool(int)>;

// Runs the command on a pseudo-terminal, answering prompts from the password map.
class PtyProcessRunner : public ProcessRunner {
public:
    PtyProcessRunner(const config::RunnerConfig& config, CancelProbe cancel_probe);

    RunOutcome Run(const jobs::UnifiedJob& job,
                   const std::vector<std::string>& args,
                   const std::string& cwd,
                   const utils::EnvMap& env,
                   const jobs::PasswordPromptMap& passwords,
                   const jobs::OutputSink& sink) override;

private:
    int Terminate(int pid) const;

    std::chrono::milliseconds poll_interval_;
    std::chrono::seconds termination_grace_;
    CancelProbe cancel_probe_;
};

}  // namespace playrun::sandbox
