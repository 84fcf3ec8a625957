#include "tasks/base_task.hpp"

#include <cstdlib>
#include <utility>

#include "nlohmann/json.hpp"
#include "sandbox/sandbox_wrapper.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace playrun::tasks {
namespace {

const char* const kCanceledBeforeLaunch = "Job canceled before launch";

}  // namespace

BaseTask::BaseTask(const config::Config& config, jobs::JobStore& store, sandbox::ProcessRunner& runner)
    : config_(config), store_(store), runner_(runner), cipher_(config.security.secret_key) {}

void BaseTask::PreRunHook(const jobs::UnifiedJob&) {}

void BaseTask::PostRunHook(const jobs::UnifiedJob&, jobs::JobStatus) {}

void BaseTask::FinalRunHook(const jobs::UnifiedJob&, jobs::JobStatus) {}

utils::EnvMap BaseTask::BuildBaseEnv() const {
    utils::EnvMap env;
    for (const auto& name : config_.env.passthrough) {
        if (const char* value = std::getenv(name.c_str())) {
            env[name] = value;
        }
    }
    env["PYTHONUNBUFFERED"] = "1";
    env["ANSIBLE_FORCE_COLOR"] = "True";
    env["ANSIBLE_HOST_KEY_CHECKING"] = "False";
    env["ANSIBLE_RETRY_FILES_ENABLED"] = "False";
    for (const auto& [key, value] : config_.env.ansible_settings) {
        env[key] = value;
    }
    return env;
}

sandbox::RunOutcome BaseTask::Execute(const jobs::UnifiedJob& job,
                                      jobs::SecretRedactor& redactor,
                                      jobs::OutputReplacements& replacements,
                                      std::string& output) {
    auto private_data = jobs::PrivateDataDir::Open(config_.paths.private_data_root);
    credentials::InjectionContext injection;
    credentials::CredentialInjector injector(cipher_, private_data, injection);

    auto plan = BuildRun(job, private_data, injector, injection);
    redactor.AddSecrets(injection.secrets);
    replacements = plan.output_replacements;

    auto env = BuildBaseEnv();
    for (const auto& [key, value] : injection.env) {
        env[key] = value;
    }
    for (const auto& [key, value] : plan.env) {
        env[key] = value;
    }

    auto args = plan.args;
    if (plan.sandboxed && config_.sandbox.enabled) {
        const auto spec = sandbox::PlanSandbox(config_.sandbox, plan.cwd, private_data);
        args = sandbox::WrapArgs(args, spec);
    }
    if (!injection.ssh_key_path.empty()) {
        args = jobs::WrapWithSshAgent(args, injection.ssh_key_path, private_data.AuthSockPath());
    }

    jobs::ModelUpdate record{};
    record.job_args = nlohmann::json(redactor.RedactArgs(args)).dump();
    record.job_cwd = plan.cwd;
    record.job_env = redactor.RedactEnv(env);
    store_.UpdateModel(job.id, record);

    utils::LogInfo("task", Name() + " " + std::to_string(job.id) + " launching " + redactor.Redact(args.front()));
    const auto sink = [this, &output](const std::string& chunk) {
        output += chunk;
        if (output_sink_) {
            output_sink_(chunk);
        }
    };
    auto outcome = runner_.Run(job, args, plan.cwd, env, injection.passwords, sink);
    private_data.Close();
    return outcome;
}

jobs::RunResult BaseTask::Run(int id) {
    jobs::ModelUpdate start{};
    start.status = jobs::JobStatus::kRunning;
    start.celery_task_id = "";
    auto job = store_.UpdateModel(id, start);

    jobs::RunResult result{};
    result.status = jobs::JobStatus::kError;
    std::string traceback;
    std::string output;
    std::string explanation;
    bool launched = false;
    jobs::OutputReplacements replacements;
    jobs::SecretRedactor redactor;

    try {
        if (!job.cancel_flag) {
            PreRunHook(job);
            job = store_.Get(id);
        }
        if (job.cancel_flag) {
            utils::LogInfo("task", Name() + " " + std::to_string(id) + " canceled before launch");
            result.status = jobs::JobStatus::kCanceled;
            traceback = kCanceledBeforeLaunch;
        } else {
            launched = true;
            const auto outcome = Execute(job, redactor, replacements, output);
            result.status = outcome.status;
            result.exit_code = outcome.exit_code;
            explanation = outcome.explanation;
        }
    } catch (const TemplateError& ex) {
        result.status = jobs::JobStatus::kFailed;
        traceback = ex.what();
    } catch (const InjectorError& ex) {
        result.status = jobs::JobStatus::kFailed;
        traceback = ex.what();
    } catch (const std::exception& ex) {
        if (result.status != jobs::JobStatus::kCanceled) {
            result.status = jobs::JobStatus::kError;
            traceback = ex.what();
        }
    }
    traceback = redactor.Redact(traceback);
    if (!traceback.empty() && result.status != jobs::JobStatus::kCanceled) {
        utils::LogError("task", Name() + " " + std::to_string(id) + " " + traceback);
    }

    try {
        PostRunHook(job, result.status);
    } catch (const std::exception& ex) {
        utils::LogError("task", Name() + " " + std::to_string(id) + " post run hook failed: " +
                                    redactor.Redact(ex.what()));
    }

    jobs::ModelUpdate finish{};
    finish.status = result.status;
    finish.result_traceback = traceback;
    jobs::OutputReplacements safe_replacements;
    for (const auto& [before, after] : replacements) {
        safe_replacements.emplace_back(redactor.Redact(before), after);
    }
    finish.output_replacements = safe_replacements;
    if (launched) {
        finish.result_stdout = redactor.Redact(jobs::SecretRedactor::ApplyReplacements(output, replacements));
    }
    if (!explanation.empty()) {
        finish.job_explanation = explanation;
    }
    job = store_.UpdateModel(id, finish);
    utils::LogInfo("task", Name() + " " + std::to_string(id) + " finished " + jobs::StatusToString(result.status));

    try {
        FinalRunHook(job, result.status);
    } catch (const std::exception& ex) {
        utils::LogError("task", Name() + " " + std::to_string(id) + " final run hook failed: " +
                                    redactor.Redact(ex.what()));
    }
    return result;
}

}  // namespace playrun::tasks
