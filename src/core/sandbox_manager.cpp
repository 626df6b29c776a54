/**
 * @file sandbox_manager.cpp
 * @brief Implementation of the sandbox lifecycle
 *
 * **Sandbox Architecture**:
 * ```
 * Host
 * └─ Docker container (qemux/qemu)
 *     ├─ /boot.img   <- storage/sandboxes/<name>/data.img (private copy)
 *     ├─ /shared     <- host shared directory (9p inside the guest)
 *     └─ QEMU guest
 *         ├─ sshd                 (ssh)
 *         ├─ noVNC                (vnc)
 *         ├─ observation service  (observation)
 *         └─ kernel gateway       (kernel)
 * ```
 *
 * @date 2025
 */

#include "vmbench/core/sandbox_manager.hpp"
#include "vmbench/core/errors.hpp"
#include "vmbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <thread>
#include <utility>

namespace vmbench {
namespace core {

using utils::ContainerState;
using utils::StringUtils;

std::string SandboxStatusToString(SandboxStatus status) {
    switch (status) {
        case SandboxStatus::ABSENT:  return "absent";
        case SandboxStatus::CREATED: return "created";
        case SandboxStatus::RUNNING: return "running";
        case SandboxStatus::PAUSED:  return "paused";
        case SandboxStatus::STOPPED: return "stopped";
    }
    return "unknown";
}

// Constructor
SandboxManager::SandboxManager(SandboxDescriptor descriptor,
                               std::shared_ptr<SandboxBackends> backends,
                               SandboxManagerOptions options)
    : descriptor_(std::move(descriptor))
    , backends_(std::move(backends))
    , containers_(backends_->Containers())
    , options_(std::move(options)) {

    ShellConfig shell_config = options_.shell;
    shell_config.host = descriptor_.ServiceHost();
    shell_config.port = descriptor_.HostPort(port_keys::kShell);
    shell_ = std::make_unique<ShellChannel>(backends_->NewShellTransport(), shell_config);

    observation_ = std::make_unique<ObservationClient>(
        backends_->NewHttpTransport(descriptor_.ServiceHost(),
                                    descriptor_.HostPort(port_keys::kObservation)),
        descriptor_.HostSharedDir());

    spdlog::debug("Sandbox manager for {} (image {})", descriptor_.Name(), descriptor_.Image());
    AttachIfRunning();
}

// Destructor
SandboxManager::~SandboxManager() {
    if (options_.preserve_on_exit) {
        spdlog::info("Preserving sandbox {}", descriptor_.Name());
        return;
    }
    Cleanup(false);
}

void SandboxManager::AttachIfRunning() {
    std::optional<utils::ContainerInfo> info;
    try {
        info = containers_->Inspect(descriptor_.Name());
    }
    catch (const VmbenchError& e) {
        spdlog::warn("Could not inspect {}: {}", descriptor_.Name(), e.what());
        return;
    }

    if (!info) {
        spdlog::debug("No existing container named {}", descriptor_.Name());
        return;
    }

    container_id_ = info->id;
    switch (info->state) {
        case ContainerState::RUNNING:
        case ContainerState::RESTARTING:
            status_ = SandboxStatus::RUNNING;
            owns_storage_ = false;
            break;
        case ContainerState::PAUSED:
            status_ = SandboxStatus::PAUSED;
            owns_storage_ = false;
            break;
        case ContainerState::CREATED:
            status_ = SandboxStatus::CREATED;
            break;
        default:
            status_ = SandboxStatus::STOPPED;
            break;
    }

    spdlog::info("Attached to existing container {} ({})",
                 descriptor_.Name(), SandboxStatusToString(status_));
}

std::string SandboxManager::ContainerRef() const {
    return container_id_ ? *container_id_ : descriptor_.Name();
}

// ============================================================================
// START
// ============================================================================

void SandboxManager::Start(bool wait_for_ready, bool restart_if_running) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        switch (status_) {
            case SandboxStatus::ABSENT:
                CreateFreshLocked();
                break;
            case SandboxStatus::CREATED:
            case SandboxStatus::STOPPED:
                spdlog::info("Starting container {}", descriptor_.Name());
                containers_->Start(ContainerRef());
                break;
            case SandboxStatus::RUNNING:
            case SandboxStatus::PAUSED:
                if (restart_if_running) {
                    spdlog::info("Restarting container {}", descriptor_.Name());
                    containers_->Restart(ContainerRef());
                } else {
                    spdlog::debug("Container {} already {}", descriptor_.Name(),
                                  SandboxStatusToString(status_));
                }
                break;
        }

        if (status_ != SandboxStatus::PAUSED || restart_if_running) {
            status_ = SandboxStatus::RUNNING;
        }

        if (wait_for_ready) {
            WaitUntilReadyLocked();
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to start sandbox {}: {}", descriptor_.Name(), e.what());
        CleanupLocked(true);
        throw;
    }
}

void SandboxManager::CreateFreshLocked() {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("CREATING SANDBOX {}", descriptor_.Name());
    spdlog::info("═══════════════════════════════════════════════════════════════");

    descriptor_.Validate();
    if (force_removed_) {
        throw SandboxCreationError("Sandbox " + descriptor_.Name() + " was force-removed");
    }

    if (!containers_->ImageExists(descriptor_.Image())) {
        spdlog::warn("Image {} not found locally, pulling...", descriptor_.Image());
        containers_->PullImage(descriptor_.Image());
    }
    spdlog::info("✓ Image {} available", descriptor_.Image());

    std::error_code ec;
    std::filesystem::create_directories(descriptor_.InstanceDir(), ec);
    if (ec) {
        throw SandboxCreationError("Cannot create " + descriptor_.InstanceDir().string() +
                                   ": " + ec.message());
    }
    std::filesystem::copy_file(descriptor_.BaseDataImage(), descriptor_.InstanceDataImage(),
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw SandboxCreationError("Cannot copy base disk to " +
                                   descriptor_.InstanceDataImage().string() + ": " + ec.message());
    }
    owns_storage_ = true;
    spdlog::info("✓ Private disk at {}", descriptor_.InstanceDataImage().string());

    utils::ContainerSpec spec;
    spec.name = descriptor_.Name();
    spec.image = descriptor_.Image();
    for (const auto& [key, mapping] : descriptor_.Ports()) {
        spec.ports.push_back({mapping.host_port, mapping.guest_port});
    }
    spec.environment = {
        {"RAM_SIZE", descriptor_.VmRam()},
        {"CPU_CORES", std::to_string(descriptor_.VmCpuCores())},
        {"DISK_SIZE", descriptor_.VmDiskSize()},
        {"DEBUG", descriptor_.DebugEnabled() ? "Y" : "N"}
    };
    for (const auto& [key, value] : descriptor_.ExtraEnv()) {
        spec.environment[key] = value;
    }
    spec.mounts = {
        {descriptor_.InstanceDataImage().string(), "/boot.img", false},
        {descriptor_.HostSharedDir().string(), "/shared", false}
    };
    spec.devices = {"/dev/kvm", "/dev/net/tun"};
    spec.capabilities_add = {"NET_ADMIN"};

    container_id_ = containers_->Run(spec);
    status_ = SandboxStatus::CREATED;

    // A removal requested while docker run was in flight found nothing to remove
    if (force_removed_) {
        containers_->Remove(*container_id_, true);
        container_id_.reset();
        status_ = SandboxStatus::ABSENT;
        throw SandboxCreationError("Sandbox " + descriptor_.Name() +
                                   " was force-removed during creation");
    }

    spdlog::info("✓ Container {} created ({})", descriptor_.Name(),
                 StringUtils::Truncate(*container_id_, 12, ""));
}

void SandboxManager::WaitUntilReadyLocked() {
    spdlog::info("Waiting for sandbox {} to accept commands (up to {:.0f}s)...",
                 descriptor_.Name(), options_.ready_timeout.count());

    auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(options_.ready_timeout);
    int attempt = 0;

    while (true) {
        ++attempt;
        try {
            shell_->Connect();
            auto out = shell_->ExecCommand("echo ready");
            if (out && StringUtils::Trim(out->stdout_output) == "ready") {
                spdlog::info("✓ Sandbox {} ready after {} probe(s)", descriptor_.Name(), attempt);
                return;
            }
            spdlog::debug("Readiness probe {} returned unexpected output", attempt);
        }
        catch (const VmbenchError& e) {
            spdlog::debug("Readiness probe {} failed: {}", attempt, e.what());
        }

        if (force_removed_) {
            throw SandboxUnreachableError("Sandbox " + descriptor_.Name() + " was removed");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw SandboxUnreachableError("Sandbox " + descriptor_.Name() +
                                          " not ready after " + std::to_string(attempt) +
                                          " probe(s)");
        }
        std::this_thread::sleep_for(options_.ready_interval);
    }
}

// ============================================================================
// BOOTSTRAP
// ============================================================================

void SandboxManager::Bootstrap() {
    Start(true, false);

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string mount = StringUtils::ShellQuote(descriptor_.GuestSharedDir());
        shell_->ExecCommand("mkdir -p " + mount, {}, true);
        // Adopted sandboxes may already have it mounted
        shell_->ExecCommand("sh -c " + StringUtils::ShellQuote(
                                "mountpoint -q " + mount +
                                " || mount -t 9p -o trans=virtio shared " + mount),
                            {}, true);
        spdlog::info("✓ Shared directory mounted at {}", descriptor_.GuestSharedDir());

        observation_->WaitUntilHealthy(options_.health_retries, options_.health_delay);
    }
    catch (const std::exception& e) {
        spdlog::error("Bootstrap of {} failed: {}", descriptor_.Name(), e.what());
        CleanupLocked(true);
        throw;
    }
}

// ============================================================================
// STOP / CLEANUP
// ============================================================================

void SandboxManager::Stop() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!containers_->Stop(ContainerRef(), std::chrono::seconds(120))) {
        spdlog::debug("Container {} already gone", descriptor_.Name());
        container_id_.reset();
        status_ = SandboxStatus::ABSENT;
        return;
    }
    status_ = SandboxStatus::STOPPED;
    spdlog::info("✓ Container {} stopped", descriptor_.Name());
}

void SandboxManager::Cleanup(bool delete_storage) {
    std::lock_guard<std::mutex> lock(mutex_);
    CleanupLocked(delete_storage);
}

void SandboxManager::CleanupLocked(bool delete_storage) {
    spdlog::info("Cleaning up sandbox {}...", descriptor_.Name());

    observation_->Shutdown();

    const std::string ref = ContainerRef();
    try {
        containers_->Stop(ref, std::chrono::seconds(120));
    }
    catch (const std::exception& e) {
        spdlog::warn("Failed to stop {}: {}", descriptor_.Name(), e.what());
    }
    try {
        if (containers_->Remove(ref, true)) {
            spdlog::info("✓ Container {} removed", descriptor_.Name());
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Failed to remove {}: {}", descriptor_.Name(), e.what());
    }
    container_id_.reset();
    status_ = SandboxStatus::ABSENT;

    if (delete_storage && owns_storage_) {
        std::error_code ec;
        std::filesystem::remove_all(descriptor_.InstanceDir(), ec);
        if (ec) {
            spdlog::warn("Failed to delete {}: {}", descriptor_.InstanceDir().string(), ec.message());
        } else {
            spdlog::debug("Deleted {}", descriptor_.InstanceDir().string());
        }
    }

    try {
        shell_->Close();
    }
    catch (const std::exception& e) {
        spdlog::warn("Failed to close shell for {}: {}", descriptor_.Name(), e.what());
    }
}

bool SandboxManager::ForceRemove() {
    force_removed_ = true;
    try {
        bool removed = containers_->Remove(descriptor_.Name(), true);
        spdlog::warn("Force-removed container {}", descriptor_.Name());
        return removed;
    }
    catch (const std::exception& e) {
        spdlog::error("Force removal of {} failed: {}", descriptor_.Name(), e.what());
        return false;
    }
}

SandboxStatus SandboxManager::Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<std::string> SandboxManager::Id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return container_id_;
}

bool SandboxManager::OwnsStorage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owns_storage_;
}

} // namespace core
} // namespace vmbench
