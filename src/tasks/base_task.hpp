#pragma once

#include <string>
#include <utility>
#include <vector>

#include "config/config_schema.hpp"
#include "credentials/credential_injector.hpp"
#include "credentials/field_encryption.hpp"
#include "jobs/job_store.hpp"
#include "jobs/job_types.hpp"
#include "jobs/private_data_dir.hpp"
#include "jobs/secret_redactor.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "utils/common.hpp"

namespace playrun::tasks {

// Command line, working dir and kind-specific environment for one run.
struct RunPlan {
    std::vector<std::string> args;
    std::string cwd;
    // Applied after credential injection, so these always win.
    utils::EnvMap env;
    jobs::OutputReplacements output_replacements;
    bool sandboxed = false;
};

class BaseTask {
public:
    BaseTask(const config::Config& config, jobs::JobStore& store, sandbox::ProcessRunner& runner);
    virtual ~BaseTask() = default;

    // Drives one unit of work to a terminal state. Failures are reported in the result, not thrown.
    jobs::RunResult Run(int id);

    // Receives every output chunk as it is produced.
    void SetOutputSink(jobs::OutputSink sink) { output_sink_ = std::move(sink); }

protected:
    virtual std::string Name() const = 0;
    virtual RunPlan BuildRun(const jobs::UnifiedJob& job,
                             jobs::PrivateDataDir& private_data,
                             credentials::CredentialInjector& injector,
                             credentials::InjectionContext& injection) = 0;

    virtual void PreRunHook(const jobs::UnifiedJob& job);
    virtual void PostRunHook(const jobs::UnifiedJob& job, jobs::JobStatus status);
    virtual void FinalRunHook(const jobs::UnifiedJob& job, jobs::JobStatus status);

    utils::EnvMap BuildBaseEnv() const;

    const config::Config& config_;
    jobs::JobStore& store_;
    sandbox::ProcessRunner& runner_;
    credentials::FieldCipher cipher_;

private:
    sandbox::RunOutcome Execute(const jobs::UnifiedJob& job,
                                jobs::SecretRedactor& redactor,
                                jobs::OutputReplacements& replacements,
                                std::string& output);

    jobs::OutputSink output_sink_;
};

}  // namespace playrun::tasks
