#pragma once

#include <optional>
#include <string>

#include "jobs/resource_lock.hpp"
#include "tasks/base_task.hpp"

namespace playrun::tasks {

// Credentials embedded in an scm url; empty parts are left out.
std::string EmbedScmCredentials(const std::string& url, const std::string& username, const std::string& password);

// Checks out or updates a project through the project_update.yml playbook.
// Concurrent updates of the same project serialize on <project_path>.lock.
class RunProjectUpdate : public BaseTask {
public:
    RunProjectUpdate(const config::Config& config,
                     jobs::JobStore& store,
                     sandbox::ProcessRunner& runner,
                     const jobs::ResourceLockManager& locks);

    std::string ProjectPath(const jobs::UnifiedJob& job) const;
    std::string LockFile(const jobs::UnifiedJob& job) const;

protected:
    std::string Name() const override { return "project_update"; }
    RunPlan BuildRun(const jobs::UnifiedJob& job,
                     jobs::PrivateDataDir& private_data,
                     credentials::CredentialInjector& injector,
                     credentials::InjectionContext& injection) override;

    void PreRunHook(const jobs::UnifiedJob& job) override;
    void PostRunHook(const jobs::UnifiedJob& job, jobs::JobStatus status) override;

private:
    const jobs::ResourceLockManager& locks_;
    std::optional<jobs::ResourceLock> lock_;
};

}  // namespace playrun::tasks
