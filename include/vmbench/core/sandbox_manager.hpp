/**
 * @file sandbox_manager.hpp
 * @brief Lifecycle of one docker-hosted QEMU sandbox
 *
 * Owns exactly one sandbox instance: attaches to an existing container with
 * the same name, creates a fresh one from the base disk, waits for the guest
 * shell, mounts the shared directory and tears everything down again.
 *
 * @date 2025
 */

#pragma once

#include "vmbench/core/observation_client.hpp"
#include "vmbench/core/sandbox_backends.hpp"
#include "vmbench/core/sandbox_descriptor.hpp"
#include "vmbench/core/shell_channel.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace vmbench {
namespace core {

/**
 * @enum SandboxStatus
 * @brief State of the managed instance
 */
enum class SandboxStatus {
    ABSENT,    ///< No container known
    CREATED,   ///< Container created, never started
    RUNNING,   ///< Container running
    PAUSED,    ///< Container paused
    STOPPED    ///< Container exited or dead
};

std::string SandboxStatusToString(SandboxStatus status);

/**
 * @struct SandboxManagerOptions
 * @brief Lifecycle tuning
 */
struct SandboxManagerOptions {
    ShellConfig shell;                                               ///< Host/port filled from the descriptor
    std::chrono::duration<double> ready_timeout{300.0};              ///< Readiness window
    std::chrono::duration<double> ready_interval{5.0};               ///< Readiness probe interval
    int health_retries{15};                                          ///< Observation health attempts
    std::chrono::duration<double> health_delay{10.0};                ///< Delay between health attempts
    bool preserve_on_exit{false};                                    ///< Skip cleanup in the destructor
};

/**
 * @class SandboxManager
 * @brief Start, bootstrap, stop and remove a sandbox
 *
 * **State transitions on Start()**:
 * ```
 * ABSENT              -> CreateFresh -> RUNNING
 * CREATED / STOPPED   -> start       -> RUNNING
 * RUNNING / PAUSED    -> no-op, or restart when requested
 * ```
 *
 * **Usage Example**:
 * @code
 * auto backends = std::make_shared<DefaultBackends>();
 * auto manager = std::make_shared<SandboxManager>(descriptor, backends);
 * manager->Bootstrap();
 *
 * manager->Shell().ExecCommand("ls /mnt");
 * manager->Cleanup(true);
 * @endcode
 */
class SandboxManager {
public:
    /**
     * @brief Construct manager and attach to an existing container if present
     *
     * A running or paused container is adopted and its storage is never
     * deleted. Control-plane errors are logged and treated as "not found".
     */
    SandboxManager(SandboxDescriptor descriptor,
                   std::shared_ptr<SandboxBackends> backends,
                   SandboxManagerOptions options = {});

    ~SandboxManager();

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /**
     * @brief Bring the instance to RUNNING
     * @param wait_for_ready Poll the guest shell with `echo ready`
     * @param restart_if_running Restart an already running instance
     * @throws SandboxCreationError, ControlPlaneError, SandboxUnreachableError
     *
     * Any failure triggers Cleanup(true) before the error is rethrown.
     */
    void Start(bool wait_for_ready = true, bool restart_if_running = false);

    /**
     * @brief Start, mount the shared directory, wait for the observation service
     *
     * Any failure triggers Cleanup(true) before the error is rethrown.
     */
    void Bootstrap();

    /**
     * @brief Stop the container ("already gone" is success)
     * @throws ControlPlaneError
     */
    void Stop();

    /**
     * @brief Stop and force-remove the container, close the shell (idempotent)
     * @param delete_storage Remove the private instance directory if owned
     *
     * Failures are logged, never thrown.
     */
    void Cleanup(bool delete_storage);

    /**
     * @brief Force-remove the container without taking the manager lock
     *
     * Used by the job supervisor on timeout to break blocked I/O. The
     * removal sticks: a container created afterwards is removed again and
     * readiness polling stops.
     * @return true if a container was removed
     */
    bool ForceRemove();

    ShellChannel& Shell() { return *shell_; }
    ObservationClient& Observation() { return *observation_; }
    const SandboxDescriptor& Descriptor() const { return descriptor_; }

    SandboxStatus Status() const;
    std::optional<std::string> Id() const;
    bool OwnsStorage() const;

    void SetPreserveOnExit(bool preserve) { options_.preserve_on_exit = preserve; }

private:
    SandboxDescriptor descriptor_;
    std::shared_ptr<SandboxBackends> backends_;
    std::shared_ptr<utils::ContainerBackend> containers_;
    SandboxManagerOptions options_;

    std::unique_ptr<ShellChannel> shell_;
    std::unique_ptr<ObservationClient> observation_;

    std::optional<std::string> container_id_;
    SandboxStatus status_{SandboxStatus::ABSENT};
    bool owns_storage_{true};
    std::atomic<bool> force_removed_{false};

    mutable std::mutex mutex_;

    void AttachIfRunning();
    void CreateFreshLocked();
    void WaitUntilReadyLocked();
    void CleanupLocked(bool delete_storage);
    std::string ContainerRef() const;
};

} // namespace core
} // namespace vmbench
