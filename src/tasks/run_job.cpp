#include "tasks/run_job.hpp"

#include <algorithm>

#include "nlohmann/json.hpp"

namespace playrun::tasks {

RunPlan RunJob::BuildRun(const jobs::UnifiedJob& job,
                         jobs::PrivateDataDir& private_data,
                         credentials::CredentialInjector& injector,
                         credentials::InjectionContext& injection) {
    const auto& options = job.job;
    const auto identity = injector.InjectMachine(job.credential ? &*job.credential : nullptr, job.launch_passwords);
    if (job.cloud_credential) {
        injector.InjectCloud(*job.cloud_credential);
    }
    if (job.network_credential) {
        injector.InjectNetwork(*job.network_credential);
    }
    const auto& passwords = injection.passwords;

    RunPlan plan{};
    auto& args = plan.args;
    args = {config_.runner.playbook_command, "-i", options.inventory};
    if (options.job_type == "check") {
        args.push_back("--check");
    }
    args.insert(args.end(), {"-u", identity.username});
    if (passwords.Has("ssh_password")) {
        args.push_back("--ask-pass");
    }
    if (options.become_enabled) {
        args.push_back("--become");
    }
    if (options.diff_mode) {
        args.push_back("--diff");
    }
    if (!identity.become_method.empty()) {
        args.insert(args.end(), {"--become-method", identity.become_method});
    }
    if (!identity.become_username.empty()) {
        args.insert(args.end(), {"--become-user", identity.become_username});
    }
    if (passwords.Has("become_password")) {
        args.push_back("--ask-become-pass");
    }
    if (passwords.Has("vault_password")) {
        args.push_back("--ask-vault-pass");
    }
    if (options.forks > 0) {
        args.push_back("--forks=" + std::to_string(options.forks));
    }
    if (options.force_handlers) {
        args.push_back("--force-handlers");
    }
    if (!options.limit.empty()) {
        args.insert(args.end(), {"-l", options.limit});
    }
    if (options.verbosity > 0) {
        args.push_back("-" + std::string(static_cast<std::size_t>(std::min(5, options.verbosity)), 'v'));
    }
    if (!options.job_tags.empty()) {
        args.insert(args.end(), {"-t", options.job_tags});
    }
    if (!options.skip_tags.empty()) {
        args.push_back("--skip-tags=" + options.skip_tags);
    }
    if (!options.start_at_task.empty()) {
        args.push_back("--start-at-task=" + options.start_at_task);
    }

    nlohmann::json extra_vars = {{"tower_job_id", job.id}};
    if (job.extra_vars.is_object()) {
        extra_vars.update(job.extra_vars);
    }
    args.insert(args.end(), {"-e", extra_vars.dump()});
    if (!injection.extra_vars.empty()) {
        args.insert(args.end(), {"-e", injection.extra_vars.dump()});
    }
    args.push_back(options.playbook);

    plan.cwd = options.project_path;
    plan.env["JOB_ID"] = std::to_string(job.id);
    plan.env["INVENTORY_ID"] = std::to_string(options.inventory_id);
    plan.env["ANSIBLE_SSH_CONTROL_PATH"] = private_data.MakeScratchDir("cp_") + "/%%h%%p%%r";
    plan.sandboxed = true;
    return plan;
}

}  // namespace playrun::tasks
