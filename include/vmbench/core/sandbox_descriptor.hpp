/**
 * @file sandbox_descriptor.hpp
 * @brief Immutable configuration of one sandbox instance
 *
 * A sandbox is a QEMU virtual machine hosted in a container. Its descriptor
 * fixes identity, hardware shape, the named port map, the host/guest shared
 * directory and the per-instance storage layout. Descriptors are validated
 * and their directories created eagerly at construction; afterwards they
 * never change.
 *
 * **Storage layout** (relative to the storage root):
 * ```
 * vms/ubuntu-base/storage/data.img     read-only base disk, shared by all jobs
 * sandboxes/<identity>/data.img        private copy made on create
 * ```
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace vmbench {
namespace core {

/// Logical port keys of the canonical port map
namespace port_keys {
inline constexpr const char* kShell = "ssh";              ///< Guest SSH (22)
inline constexpr const char* kDisplay = "vnc";            ///< Web VNC display (8006)
inline constexpr const char* kObservation = "observation";///< Observation service (8765)
inline constexpr const char* kKernel = "kernel";          ///< Kernel gateway (8888)
} // namespace port_keys

/**
 * @struct PortMapping
 * @brief One published port of the sandbox
 */
struct PortMapping {
    int guest_port{0};  ///< Port inside the sandbox container
    int host_port{0};   ///< Port published on the host
};

/**
 * @struct SandboxOptions
 * @brief Mutable input used to build a SandboxDescriptor
 *
 * host_ports assigns host ports to the canonical keys; a canonical key
 * without an entry is published on its guest port number.
 * additional_ports may add further entries, but cannot redefine a
 * canonical key.
 */
struct SandboxOptions {
    // Identity
    std::string name;                                   ///< Unique sandbox / container name
    std::string image{"qemux/qemu"};                    ///< Container image

    // Hardware shape
    std::string vm_ram{"4G"};                           ///< Guest memory
    int vm_cpu_cores{4};                                ///< Guest CPU cores
    std::string vm_disk_size{"25g"};                    ///< Guest disk size
    bool enable_debug{false};                           ///< Hypervisor debug output

    // Ports
    std::map<std::string, int> host_ports;              ///< Canonical key -> host port
    std::map<std::string, PortMapping> additional_ports;///< Extra published ports
    std::string service_host{"localhost"};              ///< Host address for published ports

    // Storage
    std::filesystem::path storage_root{"docker"};       ///< Root for base and private disks
    std::filesystem::path shared_dir{"results"};        ///< Host side of the shared directory
    std::optional<std::string> shared_dir_suffix;       ///< Optional sub-directory of shared_dir

    // Environment
    std::map<std::string, std::string> extra_env;       ///< Extra container environment
    std::map<std::string, std::string> runtime_env;     ///< Env exported to in-guest commands

    // Log file names inside the shared directory
    std::string setup_log_name{"task-setup.log"};
    std::string observation_log_name{"observation-server.log"};
};

/**
 * @class SandboxDescriptor
 * @brief Validated, immutable sandbox configuration
 *
 * **Invariants**:
 * - every guest and host port lies in 1..65535
 * - host ports are unique within the descriptor
 * - the base disk image exists
 * - storage root, sandboxes directory and shared directory exist
 *
 * **Usage Example**:
 * @code
 * SandboxOptions options;
 * options.name = "vmbench-3f2a9c01d4e8";
 * options.host_ports = {{"ssh", 60000}, {"vnc", 60001},
 *                       {"observation", 60002}, {"kernel", 60003}};
 * options.shared_dir = "results/toolA/job-1";
 *
 * auto descriptor = SandboxDescriptor::Create(options);
 * int ssh_port = descriptor.HostPort(port_keys::kShell);
 * @endcode
 */
class SandboxDescriptor {
public:
    /**
     * @brief Validate options, create directories and freeze the result
     * @param options Sandbox options
     * @return Immutable descriptor
     * @throws SandboxCreationError if validation fails or the base disk is missing
     */
    static SandboxDescriptor Create(const SandboxOptions& options);

    /**
     * @brief Re-run validation against the current filesystem
     * @throws SandboxCreationError on the first violated invariant
     */
    void Validate() const;

    // Identity and hardware
    const std::string& Name() const { return options_.name; }
    const std::string& Image() const { return options_.image; }
    const std::string& VmRam() const { return options_.vm_ram; }
    int VmCpuCores() const { return options_.vm_cpu_cores; }
    const std::string& VmDiskSize() const { return options_.vm_disk_size; }
    bool DebugEnabled() const { return options_.enable_debug; }
    const std::string& ServiceHost() const { return options_.service_host; }

    /**
     * @brief Effective port map (canonical keys override additional ones)
     */
    const std::map<std::string, PortMapping>& Ports() const { return ports_; }

    /**
     * @brief Host port for a logical key
     * @throws std::out_of_range if the key is not mapped
     */
    int HostPort(const std::string& key) const;

    // Storage layout
    const std::filesystem::path& StorageRoot() const { return storage_root_; }
    std::filesystem::path BaseDataImage() const;
    std::filesystem::path InstanceDir() const;
    std::filesystem::path InstanceDataImage() const;
    const std::filesystem::path& HostSharedDir() const { return host_shared_dir_; }

    /// Mount point of the shared directory inside the guest VM
    std::string GuestSharedDir() const { return "/mnt/" + options_.name; }

    /// Guest path of the task setup log
    std::string GuestSetupLog() const;

    /// Guest path of the observation service log
    std::string GuestObservationLog() const;

    /// Container environment extras
    const std::map<std::string, std::string>& ExtraEnv() const { return options_.extra_env; }

    /// Environment exported to in-guest commands, always including SHARED_DIR
    const std::map<std::string, std::string>& RuntimeEnv() const { return runtime_env_; }

private:
    explicit SandboxDescriptor(SandboxOptions options);

    SandboxOptions options_;                           ///< Frozen input
    std::map<std::string, PortMapping> ports_;         ///< Effective port map
    std::filesystem::path storage_root_;               ///< Absolute storage root
    std::filesystem::path host_shared_dir_;            ///< Absolute shared directory
    std::map<std::string, std::string> runtime_env_;   ///< Effective runtime env
};

/**
 * @brief Guest port of a canonical key, nullopt for unknown keys
 */
std::optional<int> CanonicalGuestPort(const std::string& key);

} // namespace core
} // namespace vmbench
