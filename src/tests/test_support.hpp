#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

#include "config/config_schema.hpp"
#include "credentials/credential.hpp"
#include "credentials/field_encryption.hpp"
#include "jobs/job_store.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace playrun::test {

inline constexpr const char* kTestSecretKey = "unit-test-secret-key";

class TempDir {
public:
    TempDir() {
        char pattern[] = "/tmp/playrun_test_XXXXXX";
        const char* dir = ::mkdtemp(pattern);
        if (dir == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = dir;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

inline std::string ReadFile(const std::string& path) {
    std::ifstream input(path);
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

inline config::Config MakeConfig(const std::string& private_data_root) {
    config::Config config{};
    config.paths.private_data_root = private_data_root;
    config.paths.projects_root = private_data_root + "/projects";
    config.paths.playbooks_dir = "/usr/share/playrun/playbooks";
    config.paths.inventory_scripts_dir = "/usr/share/playrun/inventory";
    config.sandbox.enabled = false;
    config.env.passthrough.clear();
    config.security.secret_key = kTestSecretKey;
    return config;
}

inline credentials::Credential MakeCredential(const std::string& namespace_id,
                                              nlohmann::json inputs,
                                              int id = 1) {
    credentials::Credential credential{};
    credential.id = id;
    credential.name = namespace_id + "-credential";
    credential.credential_type = credentials::CredentialType::Builtin(namespace_id);
    credential.inputs = std::move(inputs);
    return credential;
}

// Stores secret fields the way they sit at rest.
inline void EncryptSecretInputs(credentials::Credential& credential) {
    const credentials::FieldCipher cipher(kTestSecretKey);
    for (auto it = credential.inputs.begin(); it != credential.inputs.end(); ++it) {
        if (credential.credential_type.IsSecret(it.key()) && it.value().is_string()) {
            it.value() = cipher.Encrypt(credential.id, it.key(), it.value().get<std::string>());
        }
    }
}

// In-memory store recording every update in order.
class FakeJobStore : public jobs::JobStore {
public:
    void Put(const jobs::UnifiedJob& job) { jobs_[job.id] = job; }

    jobs::UnifiedJob Get(int id) override { return jobs_.at(id); }

    jobs::UnifiedJob UpdateModel(int id, const jobs::ModelUpdate& update) override {
        auto& job = jobs_.at(id);
        if (update.status) {
            job.status = *update.status;
        }
        updates_.emplace_back(id, update);
        return job;
    }

    void SetCancelFlag(int id, bool value) { jobs_.at(id).cancel_flag = value; }

    const std::vector<std::pair<int, jobs::ModelUpdate>>& Updates() const { return updates_; }

    const jobs::ModelUpdate& LastUpdate() const { return updates_.back().second; }

    // The update that recorded the launched command line.
    const jobs::ModelUpdate* CallRecord() const {
        for (const auto& [id, update] : updates_) {
            if (update.job_args) {
                return &update;
            }
        }
        return nullptr;
    }

private:
    std::map<int, jobs::UnifiedJob> jobs_;
    std::vector<std::pair<int, jobs::ModelUpdate>> updates_;
};

class MockProcessRunner : public sandbox::ProcessRunner {
public:
    MOCK_METHOD(sandbox::RunOutcome, Run,
                (const jobs::UnifiedJob& job,
                 const std::vector<std::string>& args,
                 const std::string& cwd,
                 const utils::EnvMap& env,
                 const jobs::PasswordPromptMap& passwords,
                 const jobs::OutputSink& sink),
                (override));
};

// Captures what the runner was handed, plus file contents that only exist during the run.
struct CapturedRun {
    jobs::UnifiedJob job;
    std::vector<std::string> args;
    std::string cwd;
    utils::EnvMap env;
    jobs::PasswordPromptMap passwords;
    std::map<std::string, std::string> files;
};

inline sandbox::RunOutcome Successful() {
    sandbox::RunOutcome outcome{};
    outcome.status = jobs::JobStatus::kSuccessful;
    outcome.exit_code = 0;
    return outcome;
}

// Runner action recording its inputs and every file under files_root, then emitting output.
inline auto CaptureRun(CapturedRun& captured,
                       const std::string& files_root,
                       sandbox::RunOutcome outcome = Successful(),
                       std::string output = {}) {
    return [&captured, files_root, outcome, output](const jobs::UnifiedJob& job,
                                                    const std::vector<std::string>& args,
                                                    const std::string& cwd,
                                                    const utils::EnvMap& env,
                                                    const jobs::PasswordPromptMap& passwords,
                                                    const jobs::OutputSink& sink) {
        captured.job = job;
        captured.args = args;
        captured.cwd = cwd;
        captured.env = env;
        captured.passwords = passwords;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(files_root)) {
            if (entry.is_regular_file()) {
                captured.files[entry.path().string()] = ReadFile(entry.path().string());
            }
        }
        if (!output.empty()) {
            sink(output);
        }
        return outcome;
    };
}

// Every persisted update serialized, for checks that a value never reached the store.
inline std::string DumpUpdates(const std::vector<std::pair<int, jobs::ModelUpdate>>& updates) {
    std::string out;
    for (const auto& [id, update] : updates) {
        out += update.ToJson().dump() + "\n";
    }
    return out;
}

}  // namespace playrun::test
