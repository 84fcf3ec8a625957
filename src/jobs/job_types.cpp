#include "jobs/job_types.hpp"

namespace playrun::jobs {

std::string StatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::kNew:
            return "new";
        case JobStatus::kPending:
            return "pending";
        case JobStatus::kWaiting:
            return "waiting";
        case JobStatus::kRunning:
            return "running";
        case JobStatus::kSuccessful:
            return "successful";
        case JobStatus::kFailed:
            return "failed";
        case JobStatus::kCanceled:
            return "canceled";
        case JobStatus::kError:
            return "error";
    }
    return "error";
}

JobStatus StatusFromString(const std::string& value) {
    if (value == "pending") {
        return JobStatus::kPending;
    }
    if (value == "waiting") {
        return JobStatus::kWaiting;
    }
    if (value == "running") {
        return JobStatus::kRunning;
    }
    if (value == "successful") {
        return JobStatus::kSuccessful;
    }
    if (value == "failed") {
        return JobStatus::kFailed;
    }
    if (value == "canceled") {
        return JobStatus::kCanceled;
    }
    if (value == "error") {
        return JobStatus::kError;
    }
    return JobStatus::kNew;
}

bool IsTerminal(JobStatus status) {
    return status == JobStatus::kSuccessful || status == JobStatus::kFailed ||
           status == JobStatus::kCanceled || status == JobStatus::kError;
}

std::string JobKindToString(JobKind kind) {
    switch (kind) {
        case JobKind::kJob:
            return "job";
        case JobKind::kProjectUpdate:
            return "project_update";
        case JobKind::kInventoryUpdate:
            return "inventory_update";
    }
    return "job";
}

JobKind JobKindFromString(const std::string& value) {
    if (value == "project_update") {
        return JobKind::kProjectUpdate;
    }
    if (value == "inventory_update") {
        return JobKind::kInventoryUpdate;
    }
    return JobKind::kJob;
}

nlohmann::json ModelUpdate::ToJson() const {
    nlohmann::json data = nlohmann::json::object();
    if (status) {
        data["status"] = StatusToString(*status);
    }
    if (celery_task_id) {
        data["celery_task_id"] = *celery_task_id;
    }
    if (output_replacements) {
        data["output_replacements"] = nlohmann::json::array();
        for (const auto& [before, after] : *output_replacements) {
            data["output_replacements"].push_back(nlohmann::json::array({before, after}));
        }
    }
    if (result_traceback) {
        data["result_traceback"] = *result_traceback;
    }
    if (job_args) {
        data["job_args"] = *job_args;
    }
    if (job_cwd) {
        data["job_cwd"] = *job_cwd;
    }
    if (job_env) {
        data["job_env"] = *job_env;
    }
    if (job_explanation) {
        data["job_explanation"] = *job_explanation;
    }
    if (result_stdout) {
        data["result_stdout"] = *result_stdout;
    }
    return data;
}

}  // namespace playrun::jobs
