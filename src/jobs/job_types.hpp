#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "credentials/credential.hpp"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace playrun::jobs {

enum class JobStatus {
    kNew,
    kPending,
    kWaiting,
    kRunning,
    kSuccessful,
    kFailed,
    kCanceled,
    kError
};

std::string StatusToString(JobStatus status);
JobStatus StatusFromString(const std::string& value);
bool IsTerminal(JobStatus status);

enum class JobKind {
    kJob,
    kProjectUpdate,
    kInventoryUpdate
};

std::string JobKindToString(JobKind kind);
JobKind JobKindFromString(const std::string& value);

struct JobOptions {
    std::string job_type = "run";
    std::string playbook;
    std::string project_path;
    std::string inventory;
    int inventory_id = 0;
    std::string limit;
    int verbosity = 0;
    int forks = 0;
    std::string job_tags;
    std::string skip_tags;
    std::string start_at_task;
    bool become_enabled = false;
    bool diff_mode = false;
    bool force_handlers = false;
};

struct ProjectUpdateOptions {
    std::string job_type = "check";
    std::string scm_type = "git";
    std::string scm_url;
    std::string scm_branch;
    bool scm_clean = false;
    bool scm_delete_on_update = false;
    std::string project_path;
};

struct InventoryUpdateOptions {
    std::string source;
    int inventory_id = 0;
    int inventory_source_id = 0;
    nlohmann::json source_vars = nlohmann::json::object();
    std::string source_regions;
    bool overwrite = false;
    bool overwrite_vars = false;
    int verbosity = 1;
};

struct UnifiedJob {
    int id = 0;
    JobKind kind = JobKind::kJob;
    JobStatus status = JobStatus::kNew;
    bool cancel_flag = false;
    std::optional<credentials::Credential> credential;
    std::optional<credentials::Credential> cloud_credential;
    std::optional<credentials::Credential> network_credential;
    nlohmann::json extra_vars = nlohmann::json::object();
    int timeout = 0;
    // Values supplied at launch for credential fields stored as "ASK".
    std::map<std::string, std::string> launch_passwords;

    JobOptions job;
    ProjectUpdateOptions project_update;
    InventoryUpdateOptions inventory_update;
};

struct PromptRule {
    std::string pattern;
    std::string key;
};

// Ordered prompt table plus the secret value for each key.
struct PasswordPromptMap {
    std::vector<PromptRule> prompts;
    std::map<std::string, std::string> values;

    void AddPrompt(const std::string& pattern, const std::string& key) {
        prompts.push_back(PromptRule{pattern, key});
    }

    bool Has(const std::string& key) const { return values.count(key) > 0; }

    std::string Get(const std::string& key) const {
        const auto it = values.find(key);
        return it == values.end() ? std::string() : it->second;
    }
};

using OutputSink = std::function<void(const std::string&)>;

using OutputReplacements = std::vector<std::pair<std::string, std::string>>;

// Named fields passed to the status-update operation; unset fields are left untouched.
struct ModelUpdate {
    std::optional<JobStatus> status;
    std::optional<std::string> celery_task_id;
    std::optional<OutputReplacements> output_replacements;
    std::optional<std::string> result_traceback;
    std::optional<std::string> job_args;
    std::optional<std::string> job_cwd;
    std::optional<utils::EnvMap> job_env;
    std::optional<std::string> job_explanation;
    std::optional<std::string> result_stdout;

    nlohmann::json ToJson() const;
};

struct RunResult {
    JobStatus status = JobStatus::kNew;
    int exit_code = -1;
};

}  // namespace playrun::jobs
