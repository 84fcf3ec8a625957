#pragma once

#include "tasks/base_task.hpp"

namespace playrun::tasks {

// ansible-playbook run of a job template.
class RunJob : public BaseTask {
public:
    using BaseTask::BaseTask;

protected:
    std::string Name() const override { return "job"; }
    RunPlan BuildRun(const jobs::UnifiedJob& job,
                     jobs::PrivateDataDir& private_data,
                     credentials::CredentialInjector& injector,
                     credentials::InjectionContext& injection) override;
};

}  // namespace playrun::tasks
