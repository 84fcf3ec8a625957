#include "tasks/run_inventory_update.hpp"

#include <algorithm>
#include <map>

#include "utils/errors.hpp"

namespace playrun::tasks {

std::string InventoryScriptName(const std::string& source) {
    static const std::map<std::string, std::string> kScripts = {
        {"ec2", "ec2.py"},
        {"vmware", "vmware.py"},
        {"azure", "windows_azure.py"},
        {"azure_rm", "azure_rm.py"},
        {"gce", "gce.py"},
        {"openstack", "openstack.py"},
        {"satellite6", "foreman.py"},
        {"cloudforms", "cloudforms.py"},
    };
    const auto it = kScripts.find(source);
    if (it == kScripts.end()) {
        throw InjectorError("unsupported inventory source: " + source);
    }
    return it->second;
}

RunPlan RunInventoryUpdate::BuildRun(const jobs::UnifiedJob& job,
                                     jobs::PrivateDataDir&,
                                     credentials::CredentialInjector& injector,
                                     credentials::InjectionContext&) {
    const auto& options = job.inventory_update;
    const auto script = config_.paths.inventory_scripts_dir + "/" + InventoryScriptName(options.source);
    injector.InjectInventorySource(job.credential ? &*job.credential : nullptr, options);

    RunPlan plan{};
    plan.args = {config_.runner.inventory_import_command,
                 "--inventory-id", std::to_string(options.inventory_id),
                 "--source", script};
    if (options.overwrite) {
        plan.args.push_back("--overwrite");
    }
    if (options.overwrite_vars) {
        plan.args.push_back("--overwrite-vars");
    }
    if (options.verbosity > 0) {
        plan.args.push_back("-v" + std::to_string(std::min(options.verbosity, 2)));
    }
    plan.cwd = config_.paths.inventory_scripts_dir;
    plan.env["INVENTORY_SOURCE_ID"] = std::to_string(options.inventory_source_id);
    plan.env["INVENTORY_UPDATE_ID"] = std::to_string(job.id);
    plan.sandboxed = true;
    return plan;
}

}  // namespace playrun::tasks
