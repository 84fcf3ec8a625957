#include <filesystem>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "tasks/run_inventory_update.hpp"
#include "tests/test_support.hpp"
#include "utils/config_files.hpp"
#include "utils/errors.hpp"

namespace playrun::tasks {
namespace {

using ::testing::_;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Not;

class RunInventoryUpdateTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = test::MakeConfig(root_.Path());
        job_.id = 11;
        job_.kind = jobs::JobKind::kInventoryUpdate;
        job_.inventory_update.source = "ec2";
        job_.inventory_update.inventory_id = 3;
        job_.inventory_update.inventory_source_id = 5;
        job_.inventory_update.source_regions = "us-east-1";
    }

    jobs::RunResult Run() {
        store_.Put(job_);
        RunInventoryUpdate task(config_, store_, runner_);
        return task.Run(job_.id);
    }

    test::TempDir root_;
    config::Config config_;
    jobs::UnifiedJob job_;
    test::FakeJobStore store_;
    ::testing::StrictMock<test::MockProcessRunner> runner_;
    test::CapturedRun captured_;
};

TEST_F(RunInventoryUpdateTest, Ec2ImportArgumentsAndEnvironment) {
    auto credential = test::MakeCredential("aws", {{"username", "AKIAEXAMPLE"}, {"password", "aws-hunter2"}});
    test::EncryptSecretInputs(credential);
    job_.credential = credential;
    job_.inventory_update.overwrite = true;
    EXPECT_CALL(runner_, Run(_, _, _, _, _, _)).WillOnce(test::CaptureRun(captured_, root_.Path()));

    EXPECT_EQ(Run().status, jobs::JobStatus::kSuccessful);
    EXPECT_EQ(captured_.args, std::vector<std::string>({
        "playrun-inventory-import", "--inventory-id", "3",
        "--source", "/usr/share/playrun/inventory/ec2.py", "--overwrite", "-v1"}));
    EXPECT_EQ(captured_.cwd, "/usr/share/playrun/inventory");
    EXPECT_EQ(captured_.env.at("INVENTORY_SOURCE_ID"), "5");
    EXPECT_EQ(captured_.env.at("INVENTORY_UPDATE_ID"), "11");
    EXPECT_EQ(captured_.env.at("AWS_ACCESS_KEY_ID"), "AKIAEXAMPLE");
    EXPECT_EQ(captured_.env.at("AWS_SECRET_ACCESS_KEY"), "aws-hunter2");

    const auto& ini_path = captured_.env.at("EC2_INI_PATH");
    ASSERT_EQ(captured_.files.count(ini_path), 1u);
    const auto ini = utils::IniDocument::Parse(captured_.files.at(ini_path));
    EXPECT_EQ(ini.Get("ec2", "regions"), "us-east-1");
    EXPECT_FALSE(std::filesystem::exists(ini_path));

    const auto* call = store_.CallRecord();
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->job_env->at("AWS_SECRET_ACCESS_KEY"), jobs::kHiddenPassword);
    EXPECT_THAT(test::DumpUpdates(store_.Updates()), Not(HasSubstr("aws-hunter2")));
}

TEST_F(RunInventoryUpdateTest, VerbosityIsCapped) {
    job_.inventory_update.verbosity = 4;
    job_.inventory_update.overwrite_vars = true;
    EXPECT_CALL(runner_, Run(_, _, _, _, _, _)).WillOnce(test::CaptureRun(captured_, root_.Path()));
    Run();
    EXPECT_THAT(captured_.args, Contains("--overwrite-vars"));
    EXPECT_THAT(captured_.args, Not(Contains("--overwrite")));
    EXPECT_EQ(captured_.args.back(), "-v2");
}

TEST_F(RunInventoryUpdateTest, QuietImportHasNoVerbosityFlag) {
    job_.inventory_update.verbosity = 0;
    EXPECT_CALL(runner_, Run(_, _, _, _, _, _)).WillOnce(test::CaptureRun(captured_, root_.Path()));
    Run();
    EXPECT_EQ(captured_.args.back(), "/usr/share/playrun/inventory/ec2.py");
}

TEST_F(RunInventoryUpdateTest, RenamedScripts) {
    EXPECT_EQ(InventoryScriptName("azure"), "windows_azure.py");
    EXPECT_EQ(InventoryScriptName("satellite6"), "foreman.py");
    EXPECT_EQ(InventoryScriptName("azure_rm"), "azure_rm.py");
    EXPECT_THROW(InventoryScriptName("file"), InjectorError);
}

TEST_F(RunInventoryUpdateTest, Satellite6UsesForemanScript) {
    job_.inventory_update.source = "satellite6";
    job_.credential = test::MakeCredential("satellite6", {
        {"host", "https://foreman.example.org"}, {"username", "admin"}, {"password", "foreman-pw"}});
    EXPECT_CALL(runner_, Run(_, _, _, _, _, _)).WillOnce(test::CaptureRun(captured_, root_.Path()));
    Run();
    EXPECT_EQ(captured_.args[4], "/usr/share/playrun/inventory/foreman.py");
}

TEST_F(RunInventoryUpdateTest, UnknownSourceFailsWithoutLaunch) {
    job_.inventory_update.source = "file";
    EXPECT_CALL(runner_, Run(_, _, _, _, _, _)).Times(0);
    EXPECT_EQ(Run().status, jobs::JobStatus::kFailed);
    EXPECT_THAT(*store_.LastUpdate().result_traceback, HasSubstr("file"));
}

TEST_F(RunInventoryUpdateTest, ImportRunsInsideSandbox) {
    config_.sandbox.enabled = true;
    config_.sandbox.hide_paths.clear();
    EXPECT_CALL(runner_, Run(_, _, _, _, _, _)).WillOnce(test::CaptureRun(captured_, root_.Path()));
    Run();
    ASSERT_FALSE(captured_.args.empty());
    EXPECT_EQ(captured_.args[0], "bwrap");
    EXPECT_THAT(captured_.args, Contains("playrun-inventory-import"));
}

}  // namespace
}  // namespace playrun::tasks
