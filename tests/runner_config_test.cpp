#include "vmbench/orchestrator/runner_config.hpp"
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "fakes.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using vmbench::orchestrator::LoadRunnerConfig;
using vmbench::orchestrator::RunnerConfig;
using vmbench::testing::TempDir;
using vmbench::testing::WriteFile;
using json = nlohmann::json;

TEST(RunnerConfigTest, Defaults) {
    RunnerConfig config;
    EXPECT_EQ(config.concurrency, 1);
    EXPECT_EQ(config.start_port, 60000);
    EXPECT_THAT(config.port_keys, ElementsAre("ssh", "vnc", "observation", "kernel"));
    EXPECT_EQ(config.job_timeout, std::chrono::seconds(720));
    EXPECT_EQ(config.image, "qemux/qemu");
    ASSERT_TRUE(config.shell_password.has_value());
    EXPECT_EQ(*config.shell_password, "password");
}

TEST(RunnerConfigTest, OverlayKeepsMissingKeys) {
    RunnerConfig config;
    json j = {{"concurrency", 3},
              {"job_timeout_seconds", 60},
              {"sandbox", {{"vm_ram", "8G"}, {"ready_timeout_seconds", 12.5}}},
              {"shell", {{"password", nullptr}, {"key_file", "/keys/id"}}},
              {"kernel", {{"preinstall_packages", json::array({"pandas"})}}}};
    from_json(j, config);

    EXPECT_EQ(config.concurrency, 3);
    EXPECT_EQ(config.job_timeout, std::chrono::seconds(60));
    EXPECT_EQ(config.vm_ram, "8G");
    EXPECT_EQ(config.vm_cpu_cores, 4);
    EXPECT_DOUBLE_EQ(config.ready_timeout.count(), 12.5);
    EXPECT_FALSE(config.shell_password.has_value());
    ASSERT_TRUE(config.shell_key_file.has_value());
    EXPECT_EQ(*config.shell_key_file, "/keys/id");
    EXPECT_THAT(config.preinstall_packages, ElementsAre("pandas"));
    EXPECT_EQ(config.shell_username, "user");
}

TEST(RunnerConfigTest, LoadFromFile) {
    TempDir tmp;
    WriteFile(tmp.Path() / "vmbench.json", R"({"results_root": "out", "start_port": 61000})");

    auto config = LoadRunnerConfig(tmp.Path() / "vmbench.json");
    EXPECT_EQ(config.results_root, std::filesystem::path("out"));
    EXPECT_EQ(config.start_port, 61000);
}

TEST(RunnerConfigTest, LoadFailures) {
    TempDir tmp;
    EXPECT_THROW(LoadRunnerConfig(tmp.Path() / "missing.json"), std::runtime_error);

    WriteFile(tmp.Path() / "bad.json", "{\"concurrency\": ");
    EXPECT_THROW(LoadRunnerConfig(tmp.Path() / "bad.json"), std::runtime_error);
}

}  // namespace
