#include "vmbench/core/sandbox_descriptor.hpp"
#include <filesystem>
#include <stdexcept>
#include "fakes.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "vmbench/core/errors.hpp"

namespace {

using vmbench::core::SandboxCreationError;
using vmbench::core::SandboxDescriptor;
using vmbench::core::SandboxOptions;
using vmbench::testing::MakeStorageRoot;
using vmbench::testing::TempDir;

SandboxOptions BaseOptions(const TempDir& tmp) {
    SandboxOptions options;
    options.name = "sbx-1";
    options.storage_root = MakeStorageRoot(tmp.Path() / "storage");
    options.shared_dir = tmp.Path() / "shared";
    options.host_ports = {{"ssh", 61000}, {"vnc", 61001}, {"observation", 61002}, {"kernel", 61003}};
    return options;
}

TEST(SandboxDescriptorTest, CreatesDirectories) {
    TempDir tmp;
    auto options = BaseOptions(tmp);
    options.shared_dir_suffix = "toolA/job-1";

    auto descriptor = SandboxDescriptor::Create(options);

    EXPECT_EQ(descriptor.HostSharedDir(), tmp.Path() / "shared" / "toolA" / "job-1");
    EXPECT_TRUE(std::filesystem::is_directory(descriptor.HostSharedDir()));
    EXPECT_TRUE(std::filesystem::is_directory(tmp.Path() / "storage" / "sandboxes"));
    EXPECT_EQ(descriptor.InstanceDataImage(),
              tmp.Path() / "storage" / "sandboxes" / "sbx-1" / "data.img");
    EXPECT_EQ(descriptor.BaseDataImage(),
              tmp.Path() / "storage" / "vms" / "ubuntu-base" / "storage" / "data.img");
}

TEST(SandboxDescriptorTest, PortMap) {
    TempDir tmp;
    auto descriptor = SandboxDescriptor::Create(BaseOptions(tmp));

    EXPECT_EQ(descriptor.HostPort("ssh"), 61000);
    EXPECT_EQ(descriptor.HostPort("kernel"), 61003);
    EXPECT_EQ(descriptor.Ports().at("ssh").guest_port, 22);
    EXPECT_EQ(descriptor.Ports().at("vnc").guest_port, 8006);
    EXPECT_EQ(descriptor.Ports().at("observation").guest_port, 8765);
    EXPECT_EQ(descriptor.Ports().at("kernel").guest_port, 8888);
    EXPECT_THROW(descriptor.HostPort("rdp"), std::out_of_range);
}

TEST(SandboxDescriptorTest, CanonicalPortsDefaultToGuestPorts) {
    TempDir tmp;
    auto options = BaseOptions(tmp);
    options.host_ports.clear();

    auto descriptor = SandboxDescriptor::Create(options);
    EXPECT_EQ(descriptor.HostPort("ssh"), 22);
    EXPECT_EQ(descriptor.HostPort("observation"), 8765);
}

TEST(SandboxDescriptorTest, CanonicalKeysOverrideAdditionalPorts) {
    TempDir tmp;
    auto options = BaseOptions(tmp);
    options.additional_ports = {{"ssh", {2200, 62000}}, {"rdp", {3389, 62001}}};

    auto descriptor = SandboxDescriptor::Create(options);
    EXPECT_EQ(descriptor.Ports().at("ssh").guest_port, 22);
    EXPECT_EQ(descriptor.HostPort("ssh"), 61000);
    EXPECT_EQ(descriptor.Ports().at("rdp").guest_port, 3389);
    EXPECT_EQ(descriptor.HostPort("rdp"), 62001);
}

TEST(SandboxDescriptorTest, DuplicateHostPortRejected) {
    TempDir tmp;
    auto options = BaseOptions(tmp);
    options.host_ports["vnc"] = 61000;
    EXPECT_THROW(SandboxDescriptor::Create(options), SandboxCreationError);
}

TEST(SandboxDescriptorTest, InvalidPortRejected) {
    TempDir tmp;
    auto options = BaseOptions(tmp);
    options.host_ports["kernel"] = 70000;
    EXPECT_THROW(SandboxDescriptor::Create(options), SandboxCreationError);
}

TEST(SandboxDescriptorTest, MissingBaseImageRejected) {
    TempDir tmp;
    auto options = BaseOptions(tmp);
    options.storage_root = tmp.Path() / "empty-storage";
    EXPECT_THROW(SandboxDescriptor::Create(options), SandboxCreationError);
}

TEST(SandboxDescriptorTest, EmptyNameRejected) {
    TempDir tmp;
    auto options = BaseOptions(tmp);
    options.name.clear();
    EXPECT_THROW(SandboxDescriptor::Create(options), SandboxCreationError);
}

TEST(SandboxDescriptorTest, RuntimeEnvironment) {
    TempDir tmp;
    auto options = BaseOptions(tmp);
    options.runtime_env = {{"DISPLAY", ":0"}, {"SHARED_DIR", "/elsewhere"}};

    auto descriptor = SandboxDescriptor::Create(options);
    EXPECT_EQ(descriptor.GuestSharedDir(), "/mnt/sbx-1");
    EXPECT_EQ(descriptor.RuntimeEnv().at("SHARED_DIR"), "/mnt/sbx-1");
    EXPECT_EQ(descriptor.RuntimeEnv().at("DISPLAY"), ":0");
    EXPECT_EQ(descriptor.GuestSetupLog(), "/mnt/sbx-1/task-setup.log");
    EXPECT_EQ(descriptor.GuestObservationLog(), "/mnt/sbx-1/observation-server.log");
}

}  // namespace
