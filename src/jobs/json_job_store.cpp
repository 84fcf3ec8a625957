#include "jobs/json_job_store.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <unistd.h>

#include "credentials/credential_json.hpp"
#include "utils/errors.hpp"

namespace playrun::jobs {
namespace {

template <typename T>
T ValueOr(const nlohmann::json& data, const char* key, T fallback) {
    if (data.contains(key) && !data[key].is_null()) {
        return data[key].get<T>();
    }
    return fallback;
}

std::optional<credentials::Credential> ReadCredential(const nlohmann::json& data, const char* key) {
    if (!data.contains(key) || !data[key].is_object()) {
        return std::nullopt;
    }
    return credentials::CredentialFromJson(data[key]);
}

JobOptions ReadJobOptions(const nlohmann::json& data) {
    JobOptions options{};
    options.job_type = ValueOr<std::string>(data, "job_type", options.job_type);
    options.playbook = ValueOr<std::string>(data, "playbook", "");
    options.project_path = ValueOr<std::string>(data, "project_path", "");
    options.inventory = ValueOr<std::string>(data, "inventory", "");
    options.inventory_id = ValueOr<int>(data, "inventory_id", 0);
    options.limit = ValueOr<std::string>(data, "limit", "");
    options.verbosity = ValueOr<int>(data, "verbosity", 0);
    options.forks = ValueOr<int>(data, "forks", 0);
    options.job_tags = ValueOr<std::string>(data, "job_tags", "");
    options.skip_tags = ValueOr<std::string>(data, "skip_tags", "");
    options.start_at_task = ValueOr<std::string>(data, "start_at_task", "");
    options.become_enabled = ValueOr<bool>(data, "become_enabled", false);
    options.diff_mode = ValueOr<bool>(data, "diff_mode", false);
    options.force_handlers = ValueOr<bool>(data, "force_handlers", false);
    return options;
}

ProjectUpdateOptions ReadProjectUpdateOptions(const nlohmann::json& data) {
    ProjectUpdateOptions options{};
    options.job_type = ValueOr<std::string>(data, "job_type", options.job_type);
    options.scm_type = ValueOr<std::string>(data, "scm_type", options.scm_type);
    options.scm_url = ValueOr<std::string>(data, "scm_url", "");
    options.scm_branch = ValueOr<std::string>(data, "scm_branch", "");
    options.scm_clean = ValueOr<bool>(data, "scm_clean", false);
    options.scm_delete_on_update = ValueOr<bool>(data, "scm_delete_on_update", false);
    options.project_path = ValueOr<std::string>(data, "project_path", "");
    return options;
}

InventoryUpdateOptions ReadInventoryUpdateOptions(const nlohmann::json& data) {
    InventoryUpdateOptions options{};
    options.source = ValueOr<std::string>(data, "source", "");
    options.inventory_id = ValueOr<int>(data, "inventory_id", 0);
    options.inventory_source_id = ValueOr<int>(data, "inventory_source_id", 0);
    if (data.contains("source_vars") && data["source_vars"].is_object()) {
        options.source_vars = data["source_vars"];
    }
    options.source_regions = ValueOr<std::string>(data, "source_regions", "");
    options.overwrite = ValueOr<bool>(data, "overwrite", false);
    options.overwrite_vars = ValueOr<bool>(data, "overwrite_vars", false);
    options.verbosity = ValueOr<int>(data, "verbosity", options.verbosity);
    return options;
}

void ApplyUpdate(nlohmann::json& entry, const ModelUpdate& update) {
    const auto record = update.ToJson();
    for (const auto& [key, value] : record.items()) {
        entry[key] = value;
    }
    if (!entry.contains("updates") || !entry["updates"].is_array()) {
        entry["updates"] = nlohmann::json::array();
    }
    entry["updates"].push_back(record);
}

OsError LastOsError(const std::string& context) {
    const int err = errno;
    return OsError(err, std::strerror(err), context);
}

void WriteAll(int fd, const std::string& text, const std::string& path) {
    std::size_t written = 0;
    while (written < text.size()) {
        const auto count = ::write(fd, text.data() + written, text.size() - written);
        if (count < 0) {
            if (errno == EINTR) continue;
            throw LastOsError("write " + path);
        }
        written += static_cast<std::size_t>(count);
    }
}

}  // namespace

UnifiedJob UnifiedJobFromJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::runtime_error("job entry must be an object");
    }
    UnifiedJob job{};
    job.id = ValueOr<int>(data, "id", 0);
    job.kind = JobKindFromString(ValueOr<std::string>(data, "kind", "job"));
    job.status = StatusFromString(ValueOr<std::string>(data, "status", "new"));
    job.cancel_flag = ValueOr<bool>(data, "cancel_flag", false);
    job.credential = ReadCredential(data, "credential");
    job.cloud_credential = ReadCredential(data, "cloud_credential");
    job.network_credential = ReadCredential(data, "network_credential");
    if (data.contains("extra_vars") && data["extra_vars"].is_object()) {
        job.extra_vars = data["extra_vars"];
    }
    job.timeout = ValueOr<int>(data, "timeout", 0);
    if (data.contains("launch_passwords") && data["launch_passwords"].is_object()) {
        job.launch_passwords = data["launch_passwords"].get<std::map<std::string, std::string>>();
    }
    const auto options = data.contains("options") && data["options"].is_object() ? data["options"]
                                                                                  : nlohmann::json::object();
    switch (job.kind) {
        case JobKind::kJob:
            job.job = ReadJobOptions(options);
            break;
        case JobKind::kProjectUpdate:
            job.project_update = ReadProjectUpdateOptions(options);
            break;
        case JobKind::kInventoryUpdate:
            job.inventory_update = ReadInventoryUpdateOptions(options);
            break;
    }
    return job;
}

JsonJobStore::JsonJobStore(std::filesystem::path store_path, std::shared_ptr<LockFileOps> lock_ops)
    : store_path_(std::move(store_path)), locks_(std::move(lock_ops)) {}

ResourceLock JsonJobStore::LockStore() const {
    return locks_.Acquire(store_path_.string() + ".lock");
}

nlohmann::json JsonJobStore::Load() const {
    std::ifstream input(store_path_);
    if (!input) {
        throw std::runtime_error("cannot open job store: " + store_path_.string());
    }
    nlohmann::json data;
    input >> data;
    if (!data.is_object() || !data.contains("jobs") || !data["jobs"].is_array()) {
        throw std::runtime_error("job store must hold a \"jobs\" array: " + store_path_.string());
    }
    return data;
}

void JsonJobStore::Save(const nlohmann::json& data) const {
    std::string temp_path = store_path_.string() + ".XXXXXX";
    const int fd = ::mkstemp(temp_path.data());
    if (fd < 0) {
        throw LastOsError("mkstemp " + temp_path);
    }
    try {
        WriteAll(fd, data.dump(2), temp_path);
    } catch (const OsError&) {
        ::close(fd);
        std::filesystem::remove(temp_path);
        throw;
    }
    if (::close(fd) != 0) {
        const auto error = LastOsError("close " + temp_path);
        std::filesystem::remove(temp_path);
        throw error;
    }
    try {
        std::filesystem::rename(temp_path, store_path_);
    } catch (const std::filesystem::filesystem_error&) {
        std::filesystem::remove(temp_path);
        throw;
    }
}

nlohmann::json& JsonJobStore::FindEntry(nlohmann::json& data, int id) {
    for (auto& entry : data["jobs"]) {
        if (entry.is_object() && entry.value("id", 0) == id) {
            return entry;
        }
    }
    throw std::runtime_error("unknown job id " + std::to_string(id));
}

UnifiedJob JsonJobStore::Get(int id) {
    auto data = Load();
    return UnifiedJobFromJson(FindEntry(data, id));
}

UnifiedJob JsonJobStore::UpdateModel(int id, const ModelUpdate& update) {
    auto lock = LockStore();
    auto data = Load();
    auto& entry = FindEntry(data, id);
    ApplyUpdate(entry, update);
    Save(data);
    lock.Release();
    return UnifiedJobFromJson(entry);
}

bool JsonJobStore::IsCanceled(int id) {
    return Get(id).cancel_flag;
}

void JsonJobStore::Cancel(int id) {
    auto lock = LockStore();
    auto data = Load();
    FindEntry(data, id)["cancel_flag"] = true;
    Save(data);
    lock.Release();
}

}  // namespace playrun::jobs
