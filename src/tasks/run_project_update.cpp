#include "tasks/run_project_update.hpp"

#include "jobs/secret_redactor.hpp"
#include "nlohmann/json.hpp"

namespace playrun::tasks {
namespace {

std::string UrlScheme(const std::string& url) {
    const auto pos = url.find("://");
    return pos == std::string::npos ? std::string() : utils::ToLower(url.substr(0, pos));
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string EmbedScmCredentials(const std::string& url, const std::string& username, const std::string& password) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || username.empty()) {
        return url;
    }
    const auto host_start = scheme_end + 3;
    auto authority_end = url.find('/', host_start);
    if (authority_end == std::string::npos) {
        authority_end = url.size();
    }
    auto rest_start = host_start;
    const auto at = url.rfind('@', authority_end);
    if (at != std::string::npos && at >= host_start) {
        rest_start = at + 1;
    }
    std::string userinfo = username;
    if (!password.empty()) {
        userinfo += ":" + password;
    }
    return url.substr(0, host_start) + userinfo + "@" + url.substr(rest_start);
}

RunProjectUpdate::RunProjectUpdate(const config::Config& config,
                                   jobs::JobStore& store,
                                   sandbox::ProcessRunner& runner,
                                   const jobs::ResourceLockManager& locks)
    : BaseTask(config, store, runner), locks_(locks) {}

std::string RunProjectUpdate::ProjectPath(const jobs::UnifiedJob& job) const {
    const auto& path = job.project_update.project_path;
    if (!path.empty() && path.front() == '/') {
        return path;
    }
    const auto local = path.empty() ? "_" + std::to_string(job.id) : path;
    return config_.paths.projects_root + "/" + local;
}

std::string RunProjectUpdate::LockFile(const jobs::UnifiedJob& job) const {
    return ProjectPath(job) + ".lock";
}

void RunProjectUpdate::PreRunHook(const jobs::UnifiedJob& job) {
    lock_.emplace(locks_.Acquire(LockFile(job)));
}

void RunProjectUpdate::PostRunHook(const jobs::UnifiedJob&, jobs::JobStatus) {
    if (!lock_) {
        return;
    }
    auto lock = std::move(*lock_);
    lock_.reset();
    lock.Release();
}

RunPlan RunProjectUpdate::BuildRun(const jobs::UnifiedJob& job,
                                   jobs::PrivateDataDir&,
                                   credentials::CredentialInjector& injector,
                                   credentials::InjectionContext&) {
    const auto& options = job.project_update;
    const auto identity = injector.InjectScm(job.credential ? &*job.credential : nullptr, job.launch_passwords);

    nlohmann::json extra_vars = nlohmann::json::object();
    const auto scheme = UrlScheme(options.scm_url);
    std::string url_username = identity.username;
    std::string url_password = identity.password;
    if (options.scm_type == "svn") {
        extra_vars["scm_username"] = identity.username;
        extra_vars["scm_password"] = identity.password;
        url_password.clear();
        if (scheme != "svn+ssh") {
            url_username.clear();
        }
    } else if (EndsWith(scheme, "ssh")) {
        url_password.clear();
    } else if (scheme != "http" && scheme != "https") {
        url_username.clear();
        url_password.clear();
    }
    const auto scm_url = EmbedScmCredentials(options.scm_url, url_username, url_password);

    std::string branch = options.scm_branch;
    if (branch.empty()) {
        branch = options.scm_type == "hg" ? "tip" : "HEAD";
    }
    extra_vars["project_path"] = ProjectPath(job);
    extra_vars["scm_type"] = options.scm_type;
    extra_vars["scm_url"] = scm_url;
    extra_vars["scm_branch"] = branch;
    extra_vars["scm_clean"] = options.scm_clean;
    extra_vars["scm_delete_on_update"] = options.job_type == "check" ? options.scm_delete_on_update : false;
    extra_vars["scm_full_checkout"] = options.job_type == "run";

    RunPlan plan{};
    plan.args = {config_.runner.playbook_command, "-i", "localhost,", "-v", "-e", extra_vars.dump(),
                 "project_update.yml"};
    plan.cwd = config_.paths.playbooks_dir;
    plan.env["ANSIBLE_ASK_PASS"] = "False";
    plan.env["ANSIBLE_BECOME_ASK_PASS"] = "False";
    plan.env["DISPLAY"] = "";
    plan.env["PROJECT_UPDATE_ID"] = std::to_string(job.id);

    if (!identity.username.empty() && !identity.password.empty()) {
        if (scm_url != options.scm_url) {
            plan.output_replacements.emplace_back(
                scm_url, EmbedScmCredentials(options.scm_url, url_username,
                                             url_password.empty() ? "" : jobs::kHiddenPassword));
        }
        plan.output_replacements.emplace_back(
            "username=\"" + identity.username + "\" password=\"" + identity.password + "\"",
            "username=\"" + identity.username + "\" password=\"" + jobs::kHiddenPassword + "\"");
        plan.output_replacements.emplace_back(
            "--username '" + identity.username + "' --password '" + identity.password + "'",
            "--username '" + identity.username + "' --password '" + jobs::kHiddenPassword + "'");
    }
    plan.sandboxed = false;
    return plan;
}

}  // namespace playrun::tasks
