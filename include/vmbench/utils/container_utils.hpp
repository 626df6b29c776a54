/**
 * @file container_utils.hpp
 * @brief Container control-plane access for sandbox hosting containers
 *
 * Declares the ContainerBackend interface the lifecycle manager talks to and
 * its production implementation, DockerCli, which drives the docker command
 * line client. Lookups distinguish "no such container" (a normal answer)
 * from transport failures (ControlPlaneError).
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vmbench {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by the runtime
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    RESTARTING,///< Runtime is restarting the container
    EXITED,    ///< Container exited or was stopped
    DEAD,      ///< Container is dead
    UNKNOWN    ///< Unrecognized state string
};

/**
 * @brief Map a runtime state string ("running", "exited", ...) to ContainerState
 */
ContainerState ParseContainerState(const std::string& state);

/**
 * @brief Lowercase name of a state, as docker prints it
 */
std::string ContainerStateToString(ContainerState state);

/**
 * @struct ContainerInfo
 * @brief Identity and state of an existing container
 */
struct ContainerInfo {
    std::string id;                                  ///< Full container ID
    std::string name;                                ///< Container name (no leading '/')
    std::string image;                               ///< Image reference
    ContainerState state{ContainerState::UNKNOWN};   ///< Current state
};

/**
 * @struct PortPublish
 * @brief One published port: host_port on the host maps to container_port/tcp
 */
struct PortPublish {
    int host_port{0};       ///< Port on the host
    int container_port{0};  ///< Port inside the container
};

/**
 * @struct BindMount
 * @brief Host path bound into the container
 */
struct BindMount {
    std::string host_path;       ///< Absolute host path
    std::string container_path;  ///< Target path inside the container
    bool read_only{false};       ///< Mount read-only
};

/**
 * @struct ContainerSpec
 * @brief Everything needed to create and start one container
 */
struct ContainerSpec {
    std::string name;                                    ///< Container name
    std::string image;                                   ///< Image reference
    std::vector<PortPublish> ports;                      ///< Published ports
    std::map<std::string, std::string> environment;      ///< Environment variables
    std::vector<BindMount> mounts;                       ///< Bind mounts
    std::vector<std::string> devices;                    ///< Host devices to expose
    std::vector<std::string> capabilities_add;           ///< Linux capabilities to add
    std::chrono::seconds stop_timeout{120};              ///< Grace period on stop
};

/**
 * @struct CommandResult
 * @brief Exit status and combined output of a local command
 */
struct CommandResult {
    int exit_code{0};    ///< Process exit code (-1 if it could not be spawned)
    std::string output;  ///< Combined stdout/stderr
};

/// Runs argv[0] with the given arguments and captures its output
using CommandRunner = std::function<CommandResult(const std::vector<std::string>& argv)>;

/**
 * @class ContainerBackend
 * @brief Abstract container control plane
 *
 * Lookup and removal treat "no such container" as a regular outcome
 * (nullopt / false). Every other failure throws core::ControlPlaneError.
 */
class ContainerBackend {
public:
    virtual ~ContainerBackend() = default;

    /**
     * @brief Find a container by name or ID
     * @return Container info, or nullopt when no such container exists
     * @throws core::ControlPlaneError if the runtime cannot be queried
     */
    virtual std::optional<ContainerInfo> Inspect(const std::string& name_or_id) = 0;

    /// True if the image is present locally
    virtual bool ImageExists(const std::string& image) = 0;

    /// Pull an image from its registry
    virtual void PullImage(const std::string& image) = 0;

    /**
     * @brief Create and start a detached container
     * @return New container ID
     */
    virtual std::string Run(const ContainerSpec& spec) = 0;

    virtual void Start(const std::string& id) = 0;
    virtual void Restart(const std::string& id) = 0;

    /**
     * @brief Stop a container
     * @return false if the container does not exist
     */
    virtual bool Stop(const std::string& id, std::chrono::seconds timeout) = 0;

    /**
     * @brief Remove a container and its anonymous volumes
     * @return false if the container does not exist
     */
    virtual bool Remove(const std::string& id, bool force) = 0;
};

/**
 * @class DockerCli
 * @brief ContainerBackend backed by the docker command line client
 *
 * Each operation runs one docker invocation through a CommandRunner. The
 * default runner spawns the process with popen and shell-quotes every
 * argument; tests substitute their own runner to observe the arguments.
 *
 * **Usage Example**:
 * @code
 * DockerCli docker;
 * if (auto info = docker.Inspect("vmbench-1a2b3c")) {
 *     spdlog::info("State: {}", ContainerStateToString(info->state));
 * }
 *
 * ContainerSpec spec;
 * spec.name = "vmbench-1a2b3c";
 * spec.image = "qemux/qemu";
 * spec.ports.push_back({60000, 22});
 * std::string id = docker.Run(spec);
 * @endcode
 */
class DockerCli : public ContainerBackend {
public:
    /**
     * @brief Construct docker backend
     * @param binary Docker executable name or path
     * @param runner Command runner (defaults to popen)
     */
    explicit DockerCli(std::string binary = "docker", CommandRunner runner = nullptr);

    std::optional<ContainerInfo> Inspect(const std::string& name_or_id) override;
    bool ImageExists(const std::string& image) override;
    void PullImage(const std::string& image) override;
    std::string Run(const ContainerSpec& spec) override;
    void Start(const std::string& id) override;
    void Restart(const std::string& id) override;
    bool Stop(const std::string& id, std::chrono::seconds timeout) override;
    bool Remove(const std::string& id, bool force) override;

    /**
     * @brief Build the argument list for "docker run" (without the binary)
     *
     * Order: run -d --name N [--stop-timeout S] (-p H:C/tcp)* (-e K=V)*
     * (-v H:C[:ro])* (--device D)* (--cap-add C)* IMAGE
     */
    static std::vector<std::string> BuildRunArgs(const ContainerSpec& spec);

    /**
     * @brief Default runner: popen with shell-quoted arguments, stderr merged
     */
    static CommandResult RunProcess(const std::vector<std::string>& argv);

private:
    std::string binary_;    ///< Docker executable
    CommandRunner runner_;  ///< Process runner

    CommandResult Docker(const std::vector<std::string>& args) const;
    static bool IsNotFound(const std::string& output);
};

} // namespace utils
} // namespace vmbench
