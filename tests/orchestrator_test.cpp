#include "vmbench/orchestrator/orchestrator.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "fakes.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "vmbench/core/errors.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StartsWith;
using vmbench::orchestrator::JobBody;
using vmbench::orchestrator::JobBodyResult;
using vmbench::orchestrator::JobContext;
using vmbench::orchestrator::JobState;
using vmbench::orchestrator::Orchestrator;
using vmbench::orchestrator::PortBlock;
using vmbench::orchestrator::RunnerConfig;
using vmbench::orchestrator::StepRegistry;
using vmbench::testing::FakeBackends;
using vmbench::testing::MakeStorageRoot;
using vmbench::testing::ReadFile;
using vmbench::testing::TempDir;
using vmbench::testing::WriteFile;
using json = nlohmann::json;

namespace fs = std::filesystem;

const PortBlock kPorts{{"ssh", 62000}, {"vnc", 62001}, {"observation", 62002}, {"kernel", 62003}};

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.tasks_root = tmp_.Path() / "tasks";
        config_.results_root = tmp_.Path() / "results";
        config_.index_file = tmp_.Path() / "tasks" / "index.json";
        config_.storage_root = MakeStorageRoot(tmp_.Path() / "storage");
        config_.shell_initial_delay = std::chrono::duration<double>(0.0);
        config_.ready_timeout = std::chrono::duration<double>(2.0);
        config_.ready_interval = std::chrono::duration<double>(0.01);
        config_.health_retries = 2;
        config_.health_delay = std::chrono::duration<double>(0.01);
        config_.kernel_retries = 2;
        config_.kernel_delay = std::chrono::duration<double>(0.01);
        config_.poll_interval = std::chrono::milliseconds(20);
        config_.cancel_grace = std::chrono::milliseconds(5000);

        backends_->shell->fs_root = tmp_.Path() / "guest";
        fs::create_directories(backends_->shell->fs_root);
    }

    void WriteJob(const std::string& tool, const std::string& uid, const json& definition) {
        WriteFile(config_.tasks_root / tool / uid / (uid + ".json"), definition.dump());
    }

    void WriteIndex(const json& index) { WriteFile(config_.index_file, index.dump()); }

    json Summary(const std::string& tool, const std::string& uid) {
        return json::parse(ReadFile(config_.results_root / tool / uid / "summary.json"));
    }

    Orchestrator MakeOrchestrator(StepRegistry registry = StepRegistry::WithBuiltins()) {
        return Orchestrator(config_, backends_, std::move(registry));
    }

    TempDir tmp_;
    RunnerConfig config_;
    std::shared_ptr<FakeBackends> backends_ = std::make_shared<FakeBackends>();
};

JobBodyResult NoopBody(JobContext&) {
    return JobBodyResult{"success", 1, json::array(), json::object(), json::object()};
}

TEST_F(OrchestratorTest, MissingDefinitionIsSetupError) {
    auto orchestrator = MakeOrchestrator();
    auto output = orchestrator.RunJob(0, 1, "toolA", "ghost", kPorts, NoopBody);

    EXPECT_EQ(output.state, JobState::SETUP_ERROR);
    EXPECT_EQ(output.score, 0.0);
    ASSERT_TRUE(output.eval_error.has_value());
    EXPECT_EQ(*output.eval_error, "Task definition file not found: ghost");
    ASSERT_TRUE(output.error_log_path.has_value());
    EXPECT_THAT(*output.error_log_path, HasSubstr("TASK_DEFINITION_ERROR"));
    EXPECT_THAT(backends_->containers->Runs(), IsEmpty());

    auto summary = Summary("toolA", "ghost");
    EXPECT_EQ(summary["results"]["state"], "SETUP_ERROR");
}

TEST_F(OrchestratorTest, MalformedDefinitionKeepsParserMessage) {
    WriteFile(config_.tasks_root / "toolA" / "broken" / "broken.json", "{not json");
    auto orchestrator = MakeOrchestrator();
    auto output = orchestrator.RunJob(0, 1, "toolA", "broken", kPorts, NoopBody);

    EXPECT_EQ(output.state, JobState::SETUP_ERROR);
    ASSERT_TRUE(output.eval_error.has_value());
    EXPECT_THAT(*output.eval_error, StartsWith("Invalid job definition"));
    EXPECT_EQ(Summary("toolA", "broken")["results"]["state"], "SETUP_ERROR");
}

TEST_F(OrchestratorTest, MissingDefinitionSummaryWithoutErrorLog) {
    // A file where the log directory belongs makes the error log unwritable
    WriteFile(config_.results_root / "toolA" / "ghost" / "logs", "");
    auto orchestrator = MakeOrchestrator();
    auto output = orchestrator.RunJob(0, 1, "toolA", "ghost", kPorts, NoopBody);

    EXPECT_EQ(output.state, JobState::SETUP_ERROR);
    EXPECT_FALSE(output.error_log_path.has_value());
    EXPECT_EQ(Summary("toolA", "ghost")["results"]["state"], "SETUP_ERROR");
}

TEST_F(OrchestratorTest, RunAllUploadsAndEvaluates) {
    WriteIndex({{"toolA", json::array({"job-1"})}});
    WriteFile(config_.tasks_root / "toolA" / "job-1" / "data.txt", "payload");
    WriteJob("toolA", "job-1",
             {{"instruction", "Open data.txt"},
              {"config", json::array({{{"func", "upload_file_to_vm"},
                                       {"arguments", {{"local_path", "data.txt"},
                                                      {"remote_path", "/mnt/vmbench-toolA-job-1/data.txt"}}}}})},
              {"evaluation", {{"func", "always_one"}}}});
    backends_->shell->mounts["/mnt/vmbench-toolA-job-1"] = config_.results_root / "toolA" / "job-1";

    auto registry = StepRegistry::WithBuiltins();
    registry.RegisterEvaluator("always_one", [](JobContext&, const json&) { return 1.0; });
    auto orchestrator = MakeOrchestrator(std::move(registry));

    auto stats = orchestrator.RunAll(NoopBody);

    EXPECT_EQ(stats.total, 1);
    EXPECT_EQ(stats.completed, 1);
    EXPECT_EQ(stats.failed, 0);

    auto summary = Summary("toolA", "job-1");
    EXPECT_EQ(summary["uid"], "job-1");
    EXPECT_EQ(summary["results"]["state"], "COMPLETED");
    EXPECT_EQ(summary["results"]["score"], 1.0);
    EXPECT_EQ(summary["results"]["output"], 1);
    EXPECT_EQ(ReadFile(config_.results_root / "toolA" / "job-1" / "data.txt"), "payload");

    auto pool = json::parse(ReadFile(config_.results_root / "port_pool.json"));
    ASSERT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool[0]["ssh"], 60000);

    auto runs = backends_->containers->Runs();
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].name, "vmbench-toolA-job-1");
    EXPECT_FALSE(backends_->containers->Exists("vmbench-toolA-job-1"));
}

TEST_F(OrchestratorTest, NoEvaluationScoresMinusOne) {
    WriteJob("toolA", "job-1", {{"instruction", "Just look"}});
    auto orchestrator = MakeOrchestrator();

    auto output = orchestrator.RunJob(0, 1, "toolA", "job-1", kPorts, NoopBody);
    EXPECT_EQ(output.state, JobState::COMPLETED);
    EXPECT_EQ(output.score, -1.0);
    EXPECT_FALSE(output.eval_error.has_value());
    ASSERT_TRUE(output.agent_state.has_value());
    EXPECT_EQ(*output.agent_state, "success");
}

TEST_F(OrchestratorTest, UnknownEvaluatorIsReported) {
    WriteJob("toolA", "job-1", {{"instruction", "x"}, {"evaluation", {{"func", "compare_images"}}}});
    auto orchestrator = MakeOrchestrator();

    auto output = orchestrator.RunJob(0, 1, "toolA", "job-1", kPorts, NoopBody);
    EXPECT_EQ(output.state, JobState::COMPLETED);
    EXPECT_EQ(output.score, 0.0);
    ASSERT_TRUE(output.eval_error.has_value());
    EXPECT_EQ(*output.eval_error, "Unknown evaluation function: compare_images");
}

TEST_F(OrchestratorTest, BodyFailureIsTaskExecutionError) {
    WriteJob("toolA", "job-1", {{"instruction", "x"}});
    auto orchestrator = MakeOrchestrator();

    JobBody body = [](JobContext&) -> JobBodyResult { throw std::runtime_error("boom"); };
    auto output = orchestrator.RunJob(0, 1, "toolA", "job-1", kPorts, body);

    EXPECT_EQ(output.state, JobState::TASK_EXECUTION_ERROR);
    ASSERT_TRUE(output.eval_error.has_value());
    EXPECT_EQ(*output.eval_error, "Orchestrator error: boom");
    ASSERT_TRUE(output.error_log_path.has_value());

    auto log = ReadFile(config_.results_root / "toolA" / "job-1" / *output.error_log_path);
    EXPECT_THAT(log, StartsWith("Error Type: TASK_EXECUTION_ERROR"));
    EXPECT_THAT(log, HasSubstr("Task UID: job-1"));
    EXPECT_THAT(log, HasSubstr("boom"));
    EXPECT_FALSE(backends_->containers->Exists("vmbench-toolA-job-1"));
}

TEST_F(OrchestratorTest, SandboxFailureIsOrchestratorError) {
    WriteJob("toolA", "job-1", {{"instruction", "x"}});
    backends_->containers->fail_run = true;
    auto orchestrator = MakeOrchestrator();

    bool body_ran = false;
    JobBody body = [&body_ran](JobContext& ctx) {
        body_ran = true;
        return NoopBody(ctx);
    };
    auto output = orchestrator.RunJob(0, 1, "toolA", "job-1", kPorts, body);

    EXPECT_EQ(output.state, JobState::ORCHESTRATOR_ERROR);
    ASSERT_TRUE(output.eval_error.has_value());
    EXPECT_THAT(*output.eval_error, StartsWith("Sandbox setup failed: "));
    ASSERT_TRUE(output.error_log_path.has_value());
    EXPECT_THAT(*output.error_log_path, HasSubstr("ORCHESTRATOR_SETUP_ERROR"));
    EXPECT_FALSE(body_ran);
}

TEST_F(OrchestratorTest, TimeoutCancelsAndRemovesSandbox) {
    WriteJob("toolA", "job-1", {{"instruction", "x"}, {"evaluation", {{"func", "script_exit_status"}}}});
    config_.job_timeout = std::chrono::seconds(1);
    auto orchestrator = MakeOrchestrator();

    JobBody body = [](JobContext& ctx) -> JobBodyResult {
        while (!ctx.cancel.IsCancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ctx.cancel.ThrowIfCancelled();
        return {};
    };
    auto output = orchestrator.RunJob(0, 1, "toolA", "job-1", kPorts, body);

    EXPECT_EQ(output.state, JobState::TIMED_OUT);
    ASSERT_TRUE(output.eval_error.has_value());
    EXPECT_EQ(*output.eval_error, "Job timed out after 1s");
    ASSERT_TRUE(output.error_log_path.has_value());
    EXPECT_THAT(*output.error_log_path, HasSubstr("TIMEOUT"));
    EXPECT_FALSE(backends_->containers->Exists("vmbench-toolA-job-1"));

    // The worker unwinding after the deadline must not overwrite the record
    auto summary = Summary("toolA", "job-1");
    EXPECT_EQ(summary["results"]["state"], "TIMED_OUT");
}

TEST_F(OrchestratorTest, DetachedWorkerHoldsPortsUntilGone) {
    WriteIndex({{"toolA", json::array({"job-1", "job-2"})}});
    WriteJob("toolA", "job-1", {{"instruction", "x"}});
    WriteJob("toolA", "job-2", {{"instruction", "y"}});
    config_.job_timeout = std::chrono::seconds(1);
    config_.cancel_grace = std::chrono::milliseconds(50);
    auto orchestrator = MakeOrchestrator();

    // job-1 is still in docker run when its deadline and grace run out
    auto containers = backends_->containers;
    std::atomic<bool> first_gone_before_second{false};
    backends_->containers->before_run = [containers, &first_gone_before_second](
                                            const vmbench::utils::ContainerSpec& spec) {
        if (spec.name == "vmbench-toolA-job-1") {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        } else {
            auto removed = containers->Removed();
            first_gone_before_second =
                std::find(removed.begin(), removed.end(), "vmbench-toolA-job-1") != removed.end();
        }
    };

    auto stats = orchestrator.RunAll(NoopBody);
    EXPECT_EQ(stats.timed_out, 1);
    EXPECT_EQ(stats.completed, 1);
    EXPECT_TRUE(first_gone_before_second.load());
    EXPECT_FALSE(backends_->containers->Exists("vmbench-toolA-job-1"));
    EXPECT_EQ(Summary("toolA", "job-1")["results"]["state"], "TIMED_OUT");
    EXPECT_EQ(Summary("toolA", "job-2")["results"]["state"], "COMPLETED");
}

TEST_F(OrchestratorTest, OnlyFilterSelectsOneJob) {
    WriteIndex({{"toolA", json::array({"job-1", "job-2"})}});
    WriteJob("toolA", "job-1", {{"instruction", "x"}});
    WriteJob("toolA", "job-2", {{"instruction", "y"}});
    auto orchestrator = MakeOrchestrator();

    auto stats = orchestrator.RunAll(NoopBody, std::string("toolA/job-2"));
    EXPECT_EQ(stats.total, 1);
    EXPECT_EQ(stats.completed, 1);
    EXPECT_TRUE(fs::exists(config_.results_root / "toolA" / "job-2" / "summary.json"));
    EXPECT_FALSE(fs::exists(config_.results_root / "toolA" / "job-1" / "summary.json"));
}

TEST_F(OrchestratorTest, LoadIndexErrors) {
    EXPECT_THROW(Orchestrator::LoadIndex(tmp_.Path() / "missing.json"),
                 vmbench::core::JobDefinitionError);

    WriteFile(tmp_.Path() / "bad.json", "[not an index");
    EXPECT_THROW(Orchestrator::LoadIndex(tmp_.Path() / "bad.json"),
                 vmbench::core::JobDefinitionError);

    WriteFile(tmp_.Path() / "index.json", R"({"a": ["1", "2"], "b": ["3"]})");
    auto jobs = Orchestrator::LoadIndex(tmp_.Path() / "index.json");
    ASSERT_EQ(jobs.size(), 3u);
    EXPECT_EQ(jobs[0].first, "a");
    EXPECT_EQ(jobs[2].second, "3");
}

TEST_F(OrchestratorTest, ConcurrentJobsGetSeparatePorts) {
    WriteIndex({{"toolA", json::array({"job-1", "job-2"})}});
    WriteJob("toolA", "job-1", {{"instruction", "x"}});
    WriteJob("toolA", "job-2", {{"instruction", "y"}});
    config_.concurrency = 2;
    auto orchestrator = MakeOrchestrator();

    auto stats = orchestrator.RunAll(NoopBody);
    EXPECT_EQ(stats.total, 2);
    EXPECT_EQ(stats.completed, 2);

    auto runs = backends_->containers->Runs();
    ASSERT_EQ(runs.size(), 2u);
    auto ssh_port = [](const vmbench::utils::ContainerSpec& spec) {
        for (const auto& port : spec.ports) {
            if (port.container_port == 22) {
                return port.host_port;
            }
        }
        return 0;
    };
    EXPECT_NE(ssh_port(runs[0]), ssh_port(runs[1]));
    EXPECT_EQ(Summary("toolA", "job-1")["results"]["state"], "COMPLETED");
    EXPECT_EQ(Summary("toolA", "job-2")["results"]["state"], "COMPLETED");
}

}  // namespace
