#include "vmbench/utils/container_utils.hpp"
#include <string>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "vmbench/core/errors.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::ElementsAreArray;
using vmbench::utils::CommandResult;
using vmbench::utils::ContainerSpec;
using vmbench::utils::ContainerState;
using vmbench::utils::DockerCli;

// Runner answering every docker invocation with a fixed result
struct ScriptedRunner {
    CommandResult result;
    std::vector<std::vector<std::string>>* calls;

    CommandResult operator()(const std::vector<std::string>& argv) const {
        calls->push_back(argv);
        return result;
    }
};

TEST(ContainerUtilsTest, ParseContainerState) {
    EXPECT_EQ(vmbench::utils::ParseContainerState("running"), ContainerState::RUNNING);
    EXPECT_EQ(vmbench::utils::ParseContainerState(" Exited\n"), ContainerState::EXITED);
    EXPECT_EQ(vmbench::utils::ParseContainerState("restarting"), ContainerState::RESTARTING);
    EXPECT_EQ(vmbench::utils::ParseContainerState("paused"), ContainerState::PAUSED);
    EXPECT_EQ(vmbench::utils::ParseContainerState("weird"), ContainerState::UNKNOWN);
}

TEST(ContainerUtilsTest, BuildRunArgs) {
    ContainerSpec spec;
    spec.name = "vmbench-job-1";
    spec.image = "qemux/qemu";
    spec.ports = {{60000, 22}};
    spec.environment = {{"CPU_CORES", "4"}, {"RAM_SIZE", "4G"}};
    spec.mounts = {{"/data/sandboxes/vmbench-job-1/data.img", "/boot.img", false},
                   {"/data/results", "/shared", true}};
    spec.devices = {"/dev/kvm"};
    spec.capabilities_add = {"NET_ADMIN"};

    EXPECT_THAT(DockerCli::BuildRunArgs(spec),
                ElementsAreArray(std::vector<std::string>{
                    "run", "-d", "--name", "vmbench-job-1",
                    "--stop-timeout", "120",
                    "-p", "60000:22/tcp",
                    "-e", "CPU_CORES=4",
                    "-e", "RAM_SIZE=4G",
                    "-v", "/data/sandboxes/vmbench-job-1/data.img:/boot.img",
                    "-v", "/data/results:/shared:ro",
                    "--device", "/dev/kvm",
                    "--cap-add", "NET_ADMIN",
                    "qemux/qemu"}));
}

TEST(ContainerUtilsTest, InspectParsesFormattedOutput) {
    std::vector<std::vector<std::string>> calls;
    DockerCli docker("docker", ScriptedRunner{{0, "abc123|/vmbench-job-1|qemux/qemu|running\n"}, &calls});

    auto info = docker.Inspect("vmbench-job-1");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->id, "abc123");
    EXPECT_EQ(info->name, "vmbench-job-1");
    EXPECT_EQ(info->image, "qemux/qemu");
    EXPECT_EQ(info->state, ContainerState::RUNNING);

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].front(), "docker");
    EXPECT_EQ(calls[0][1], "inspect");
    EXPECT_EQ(calls[0].back(), "vmbench-job-1");
}

TEST(ContainerUtilsTest, InspectMissingContainer) {
    std::vector<std::vector<std::string>> calls;
    DockerCli docker("docker", ScriptedRunner{{1, "Error: No such container: nope"}, &calls});
    EXPECT_FALSE(docker.Inspect("nope").has_value());
}

TEST(ContainerUtilsTest, InspectDaemonFailure) {
    std::vector<std::vector<std::string>> calls;
    DockerCli docker("docker", ScriptedRunner{{1, "Cannot connect to the Docker daemon"}, &calls});
    EXPECT_THROW(docker.Inspect("x"), vmbench::core::ControlPlaneError);
}

TEST(ContainerUtilsTest, RunReturnsLastLine) {
    std::vector<std::vector<std::string>> calls;
    DockerCli docker("podman", ScriptedRunner{{0, "Pulling layer...\nDone\nfeedbeef\n"}, &calls});

    ContainerSpec spec;
    spec.name = "box";
    spec.image = "img";
    EXPECT_EQ(docker.Run(spec), "feedbeef");
    EXPECT_EQ(calls[0].front(), "podman");
}

TEST(ContainerUtilsTest, StopAndRemoveTolerateMissing) {
    std::vector<std::vector<std::string>> calls;
    DockerCli docker("docker", ScriptedRunner{{1, "Error response from daemon: No such container: x"}, &calls});

    EXPECT_FALSE(docker.Stop("x", std::chrono::seconds(5)));
    EXPECT_FALSE(docker.Remove("x", true));
    EXPECT_THAT(calls[0], ElementsAre("docker", "stop", "-t", "5", "x"));
    EXPECT_THAT(calls[1], ElementsAre("docker", "rm", "-v", "-f", "x"));
}

TEST(ContainerUtilsTest, ImageExists) {
    std::vector<std::vector<std::string>> calls;
    DockerCli present("docker", ScriptedRunner{{0, "sha256:1234"}, &calls});
    EXPECT_TRUE(present.ImageExists("qemux/qemu"));

    DockerCli missing("docker", ScriptedRunner{{1, "Error: No such image: qemux/qemu"}, &calls});
    EXPECT_FALSE(missing.ImageExists("qemux/qemu"));
}

}  // namespace
