#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <set>
#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "jobs/json_job_store.hpp"
#include "tests/test_support.hpp"

namespace playrun::jobs {
namespace {

const char* const kStore = R"({
  "jobs": [
    {
      "id": 1,
      "kind": "job",
      "status": "pending",
      "credential": {
        "id": 9,
        "name": "deploy",
        "credential_type": "ssh",
        "inputs": {"username": "root", "password": "ASK"}
      },
      "extra_vars": {"color": "blue"},
      "launch_passwords": {"ssh_password": "hunter2"},
      "timeout": 30,
      "options": {"playbook": "site.yml", "project_path": "/srv/project", "inventory": "/inv", "forks": 5}
    },
    {
      "id": 2,
      "kind": "project_update",
      "options": {"scm_type": "hg", "scm_url": "https://hg.example.org/repo", "scm_clean": true}
    },
    {
      "id": 3,
      "kind": "inventory_update",
      "options": {"source": "ec2", "source_vars": {"cache_max_age": 60}, "overwrite": true}
    }
  ]
})";

using ::testing::InSequence;
using ::testing::Return;

class MockLockFileOps : public LockFileOps {
public:
    MOCK_METHOD(int, Open, (const std::string& path), (override));
    MOCK_METHOD(void, Lock, (int fd), (override));
    MOCK_METHOD(void, Unlock, (int fd), (override));
    MOCK_METHOD(void, Close, (int fd), (override));
};

// Real flock, with a hook that runs once before the first lock is taken.
class BeforeLockOps : public PosixLockFileOps {
public:
    explicit BeforeLockOps(std::function<void()> hook) : hook_(std::move(hook)) {}

    void Lock(int fd) override {
        if (hook_) {
            auto hook = std::move(hook_);
            hook_ = nullptr;
            hook();
        }
        PosixLockFileOps::Lock(fd);
    }

private:
    std::function<void()> hook_;
};

class JsonJobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::ofstream(path_) << kStore;
    }

    nlohmann::json Document() const {
        return nlohmann::json::parse(test::ReadFile(path_));
    }

    std::set<std::string> DirectoryEntries() const {
        std::set<std::string> names;
        for (const auto& entry : std::filesystem::directory_iterator(root_.Path())) {
            names.insert(entry.path().filename().string());
        }
        return names;
    }

    test::TempDir root_;
    std::string path_ = root_.Path() + "/jobs.json";
    JsonJobStore store_{path_};
};

TEST_F(JsonJobStoreTest, ReadsEveryJobKind) {
    const auto job = store_.Get(1);
    EXPECT_EQ(job.kind, JobKind::kJob);
    EXPECT_EQ(job.status, JobStatus::kPending);
    ASSERT_TRUE(job.credential.has_value());
    EXPECT_EQ(job.credential->id, 9);
    EXPECT_EQ(job.credential->Input("username"), "root");
    EXPECT_EQ(job.extra_vars, nlohmann::json({{"color", "blue"}}));
    EXPECT_EQ(job.launch_passwords.at("ssh_password"), "hunter2");
    EXPECT_EQ(job.timeout, 30);
    EXPECT_EQ(job.job.playbook, "site.yml");
    EXPECT_EQ(job.job.forks, 5);
    EXPECT_EQ(job.job.job_type, "run");

    const auto update = store_.Get(2);
    EXPECT_EQ(update.kind, JobKind::kProjectUpdate);
    EXPECT_EQ(update.status, JobStatus::kNew);
    EXPECT_EQ(update.project_update.scm_type, "hg");
    EXPECT_TRUE(update.project_update.scm_clean);
    EXPECT_EQ(update.project_update.job_type, "check");

    const auto inventory = store_.Get(3);
    EXPECT_EQ(inventory.inventory_update.source, "ec2");
    EXPECT_EQ(inventory.inventory_update.source_vars.at("cache_max_age"), 60);
    EXPECT_TRUE(inventory.inventory_update.overwrite);
    EXPECT_EQ(inventory.inventory_update.verbosity, 1);
}

TEST_F(JsonJobStoreTest, UpdatesPersistAndKeepHistory) {
    ModelUpdate running{};
    running.status = JobStatus::kRunning;
    running.celery_task_id = "";
    EXPECT_EQ(store_.UpdateModel(2, running).status, JobStatus::kRunning);

    ModelUpdate finished{};
    finished.status = JobStatus::kSuccessful;
    finished.result_stdout = "ok\n";
    finished.output_replacements = OutputReplacements{{"a", "b"}};
    store_.UpdateModel(2, finished);

    EXPECT_EQ(JsonJobStore(path_).Get(2).status, JobStatus::kSuccessful);
    const auto entry = Document()["jobs"][1];
    EXPECT_EQ(entry["result_stdout"], "ok\n");
    EXPECT_EQ(entry["celery_task_id"], "");
    ASSERT_EQ(entry["updates"].size(), 2u);
    EXPECT_EQ(entry["updates"][0], nlohmann::json({{"status", "running"}, {"celery_task_id", ""}}));
    EXPECT_EQ(entry["updates"][1]["output_replacements"], nlohmann::json::parse(R"([["a", "b"]])"));
    EXPECT_EQ(DirectoryEntries(), std::set<std::string>({"jobs.json", "jobs.json.lock"}));
}

TEST_F(JsonJobStoreTest, CancelIsVisibleToOtherReaders) {
    EXPECT_FALSE(store_.IsCanceled(1));
    JsonJobStore(path_).Cancel(1);
    EXPECT_TRUE(store_.IsCanceled(1));
    EXPECT_TRUE(store_.Get(1).cancel_flag);
    EXPECT_FALSE(store_.IsCanceled(3));
}

TEST_F(JsonJobStoreTest, CancelCommittedWhileUpdateWaitsIsKept) {
    auto ops = std::make_shared<BeforeLockOps>([this] { JsonJobStore(path_).Cancel(1); });
    JsonJobStore updater(path_, ops);

    ModelUpdate running{};
    running.status = JobStatus::kRunning;
    const auto job = updater.UpdateModel(1, running);

    EXPECT_TRUE(job.cancel_flag);
    EXPECT_EQ(job.status, JobStatus::kRunning);
    const auto entry = Document()["jobs"][0];
    EXPECT_EQ(entry["cancel_flag"], true);
    EXPECT_EQ(entry["status"], "running");
    EXPECT_EQ(DirectoryEntries(), std::set<std::string>({"jobs.json", "jobs.json.lock"}));
}

TEST_F(JsonJobStoreTest, WritersHoldTheStoreLock) {
    auto ops = std::make_shared<MockLockFileOps>();
    {
        InSequence seq;
        for (int i = 0; i < 2; ++i) {
            EXPECT_CALL(*ops, Open(path_ + ".lock")).WillOnce(Return(7));
            EXPECT_CALL(*ops, Lock(7));
            EXPECT_CALL(*ops, Unlock(7));
            EXPECT_CALL(*ops, Close(7));
        }
    }
    JsonJobStore store(path_, ops);
    ModelUpdate running{};
    running.status = JobStatus::kRunning;
    store.UpdateModel(2, running);
    store.Cancel(2);
    EXPECT_TRUE(store.IsCanceled(2));
    EXPECT_EQ(store.Get(2).status, JobStatus::kRunning);
}

TEST_F(JsonJobStoreTest, UnknownJobThrows) {
    EXPECT_THROW(store_.Get(99), std::runtime_error);
    EXPECT_THROW(store_.Cancel(99), std::runtime_error);
}

TEST_F(JsonJobStoreTest, MissingOrMalformedStoreThrows) {
    EXPECT_THROW(JsonJobStore(root_.Path() + "/missing.json").Get(1), std::runtime_error);
    std::ofstream(path_, std::ios::trunc) << R"({"jobs": {}})";
    EXPECT_THROW(store_.Get(1), std::runtime_error);
}

}  // namespace
}  // namespace playrun::jobs
