#include <atomic>
#include <filesystem>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "sandbox/sandbox_executor.hpp"
#include "tests/test_support.hpp"
#include "utils/errors.hpp"

namespace playrun::sandbox {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

class PtyProcessRunnerTest : public ::testing::Test {
protected:
    PtyProcessRunnerTest() {
        config_.poll_interval_ms = 20;
        config_.termination_grace_s = 1;
        job_.id = 5;
        env_["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    }

    RunOutcome Shell(const std::string& script, CancelProbe probe = {}) {
        PtyProcessRunner runner(config_, std::move(probe));
        return runner.Run(job_, {"/bin/sh", "-c", script}, cwd_, env_, passwords_,
                          [this](const std::string& chunk) { output_ += chunk; });
    }

    test::TempDir root_;
    config::RunnerConfig config_;
    jobs::UnifiedJob job_;
    std::string cwd_ = root_.Path();
    utils::EnvMap env_;
    jobs::PasswordPromptMap passwords_;
    std::string output_;
};

TEST_F(PtyProcessRunnerTest, StreamsOutputOfSuccessfulCommand) {
    const auto outcome = Shell("echo hello from the pty");
    EXPECT_EQ(outcome.status, jobs::JobStatus::kSuccessful);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_THAT(output_, HasSubstr("hello from the pty"));
}

TEST_F(PtyProcessRunnerTest, NonZeroExitIsFailure) {
    const auto outcome = Shell("echo broken; exit 3");
    EXPECT_EQ(outcome.status, jobs::JobStatus::kFailed);
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_TRUE(outcome.explanation.empty());
    EXPECT_THAT(output_, HasSubstr("broken"));
}

TEST_F(PtyProcessRunnerTest, ChildSeesOnlyGivenEnvironmentAndDirectory) {
    env_["GREETING"] = "bonjour";
    Shell("echo \"env=$GREETING\"; echo \"home=${HOME:-unset}\"; echo \"dir=$(pwd -P)\"");
    EXPECT_THAT(output_, HasSubstr("env=bonjour"));
    EXPECT_THAT(output_, HasSubstr("home=unset"));
    EXPECT_THAT(output_, HasSubstr("dir=" + std::filesystem::canonical(root_.Path()).string()));
}

TEST_F(PtyProcessRunnerTest, AnswersPasswordPrompt) {
    passwords_.AddPrompt("Enter passphrase for .*:", "ssh_key_unlock");
    passwords_.AddPrompt("SSH password:", "ssh_password");
    passwords_.values["ssh_password"] = "hunter2";
    const auto outcome = Shell("printf 'SSH password: '; read -r answer; echo \"got:$answer\"");
    EXPECT_EQ(outcome.status, jobs::JobStatus::kSuccessful);
    EXPECT_THAT(output_, HasSubstr("got:hunter2"));
}

TEST_F(PtyProcessRunnerTest, CancelTerminatesProcessGroup) {
    std::atomic<int> probes{0};
    const auto outcome = Shell("echo started; sleep 30; echo finished", [&probes](int id) {
        EXPECT_EQ(id, 5);
        return ++probes > 3;
    });
    EXPECT_EQ(outcome.status, jobs::JobStatus::kCanceled);
    EXPECT_THAT(output_, Not(HasSubstr("finished")));
}

TEST_F(PtyProcessRunnerTest, TimeoutFailsWithExplanation) {
    job_.timeout = 1;
    const auto outcome = Shell("sleep 30");
    EXPECT_EQ(outcome.status, jobs::JobStatus::kFailed);
    EXPECT_EQ(outcome.explanation, "Job terminated due to timeout");
    EXPECT_NE(outcome.exit_code, 0);
}

TEST_F(PtyProcessRunnerTest, MissingExecutableIsSpawnError) {
    PtyProcessRunner runner(config_, {});
    EXPECT_THROW(runner.Run(job_, {"playrun-no-such-binary"}, cwd_, env_, passwords_, {}), SpawnError);
    EXPECT_THROW(runner.Run(job_, {}, cwd_, env_, passwords_, {}), SpawnError);
}

}  // namespace
}  // namespace playrun::sandbox
