#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "config/config_loader.hpp"
#include "credentials/credential.hpp"
#include "credentials/credential_json.hpp"
#include "jobs/json_job_store.hpp"
#include "jobs/resource_lock.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "tasks/run_inventory_update.hpp"
#include "tasks/run_job.hpp"
#include "tasks/run_project_update.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: playrun run <store.json> <id> | playrun cancel <store.json> <id> | playrun types"
              << std::endl;
}

int ExitCodeFor(playrun::jobs::JobStatus status) {
    switch (status) {
        case playrun::jobs::JobStatus::kSuccessful:
            return 0;
        case playrun::jobs::JobStatus::kFailed:
            return 1;
        case playrun::jobs::JobStatus::kCanceled:
            return 2;
        default:
            return 3;
    }
}

bool ParseId(const std::string& value, int& id) {
    try {
        std::size_t used = 0;
        id = std::stoi(value, &used);
        return used == value.size() && id > 0;
    } catch (const std::exception&) {
        return false;
    }
}

std::unique_ptr<playrun::tasks::BaseTask> CreateTask(playrun::jobs::JobKind kind,
                                                     const playrun::config::Config& config,
                                                     playrun::jobs::JobStore& store,
                                                     playrun::sandbox::ProcessRunner& runner,
                                                     const playrun::jobs::ResourceLockManager& locks) {
    switch (kind) {
        case playrun::jobs::JobKind::kProjectUpdate:
            return std::make_unique<playrun::tasks::RunProjectUpdate>(config, store, runner, locks);
        case playrun::jobs::JobKind::kInventoryUpdate:
            return std::make_unique<playrun::tasks::RunInventoryUpdate>(config, store, runner);
        case playrun::jobs::JobKind::kJob:
            break;
    }
    return std::make_unique<playrun::tasks::RunJob>(config, store, runner);
}

int RunCommand(const std::string& store_path, int id) {
    const auto config = playrun::config::LoadConfig();
    playrun::utils::LogConfig log_config{};
    log_config.min_level = playrun::utils::ParseLogLevel(config.logging.level);
    playrun::utils::ConfigureLogging(log_config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    playrun::jobs::JsonJobStore store(store_path);
    playrun::sandbox::PtyProcessRunner runner(config.runner, [&store](int job_id) {
        if (g_signal != 0) {
            return true;
        }
        try {
            return store.IsCanceled(job_id);
        } catch (const std::exception& ex) {
            playrun::utils::LogWarn("cli", std::string("cancel check failed: ") + ex.what());
            return false;
        }
    });
    playrun::jobs::ResourceLockManager locks;

    const auto job = store.Get(id);
    if (playrun::jobs::IsTerminal(job.status)) {
        playrun::utils::LogError("cli", "job " + std::to_string(id) + " already finished as " +
                                            playrun::jobs::StatusToString(job.status));
        return 1;
    }
    auto task = CreateTask(job.kind, config, store, runner, locks);
    task->SetOutputSink([](const std::string& chunk) {
        std::cout << chunk << std::flush;
    });
    const auto result = task->Run(id);
    std::cout << std::endl
              << "[" << playrun::jobs::StatusToString(result.status) << "] exit code " << result.exit_code
              << std::endl;
    return ExitCodeFor(result.status);
}

int CancelCommand(const std::string& store_path, int id) {
    playrun::jobs::JsonJobStore store(store_path);
    store.Cancel(id);
    std::cout << "cancel requested for " << id << std::endl;
    return 0;
}

int TypesCommand() {
    auto types = nlohmann::json::array();
    for (const auto& ns : playrun::credentials::CredentialType::BuiltinNamespaces()) {
        types.push_back(playrun::credentials::CredentialTypeToJson(
            playrun::credentials::CredentialType::Builtin(ns)));
    }
    std::cout << types.dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    try {
        if (command == "types") {
            return TypesCommand();
        }
        int id = 0;
        if (argc != 4 || !ParseId(argv[3], id)) {
            PrintUsage();
            return 1;
        }
        if (command == "run") {
            return RunCommand(argv[2], id);
        }
        if (command == "cancel") {
            return CancelCommand(argv[2], id);
        }
    } catch (const std::exception& ex) {
        playrun::utils::LogError("cli", ex.what());
        return 3;
    }
    PrintUsage();
    return 1;
}
