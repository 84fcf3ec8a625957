#pragma once

#include <string>

#include "tasks/base_task.hpp"

namespace playrun::tasks {

// Dynamic inventory script shipped for a source, e.g. "ec2" -> "ec2.py".
std::string InventoryScriptName(const std::string& source);

class RunInventoryUpdate : public BaseTask {
public:
    using BaseTask::BaseTask;

protected:
    std::string Name() const override { return "inventory_update"; }
    RunPlan BuildRun(const jobs::UnifiedJob& job,
                     jobs::PrivateDataDir& private_data,
                     credentials::CredentialInjector& injector,
                     credentials::InjectionContext& injection) override;
};

}  // namespace playrun::tasks
