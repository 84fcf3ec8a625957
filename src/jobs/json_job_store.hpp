#pragma once

#include <filesystem>
#include <memory>

#include "jobs/job_store.hpp"
#include "jobs/resource_lock.hpp"
#include "nlohmann/json.hpp"

namespace playrun::jobs {

UnifiedJob UnifiedJobFromJson(const nlohmann::json& data);

// Jobs kept in one JSON document: {"jobs": [{"id": 1, "kind": "job", ...}]}.
// Every update is applied to the job entry and appended to its "updates" list.
// The file is re-read on each call so another process can set cancel_flag.
// Writers hold an exclusive lock on "<store>.lock" from load to save and replace
// the document through a temp file created beside it.
class JsonJobStore : public JobStore {
public:
    explicit JsonJobStore(std::filesystem::path store_path,
                          std::shared_ptr<LockFileOps> lock_ops = std::make_shared<PosixLockFileOps>());

    UnifiedJob Get(int id) override;
    UnifiedJob UpdateModel(int id, const ModelUpdate& update) override;

    bool IsCanceled(int id);
    void Cancel(int id);

private:
    nlohmann::json Load() const;
    void Save(const nlohmann::json& data) const;
    static nlohmann::json& FindEntry(nlohmann::json& data, int id);
    ResourceLock LockStore() const;

    std::filesystem::path store_path_;
    ResourceLockManager locks_;
};

}  // namespace playrun::jobs
