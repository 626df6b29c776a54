/**
 * @file container_utils.cpp
 * @brief Implementation of the docker command line control plane
 *
 * Every call is a single docker invocation with stderr merged into stdout.
 * Exit code 0 is success. A non-zero exit whose output mentions a missing
 * object ("No such container", "No such object", "No such image") is a
 * regular negative answer; anything else is a ControlPlaneError carrying the
 * runtime's message.
 *
 * **Container Lifecycle**:
 * ```
 * Inspect -> absent:  Run
 *         -> stopped: Start
 *         -> running: no-op | Restart
 * Stop -> Remove
 * ```
 *
 * @date 2025
 */

#include "vmbench/utils/container_utils.hpp"
#include "vmbench/core/errors.hpp"
#include "vmbench/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <utility>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace vmbench {
namespace utils {

// ============================================================================
// STATE PARSING
// ============================================================================

ContainerState ParseContainerState(const std::string& state) {
    std::string s = StringUtils::ToLower(StringUtils::Trim(state));
    if (s == "created") return ContainerState::CREATED;
    if (s == "running") return ContainerState::RUNNING;
    if (s == "paused") return ContainerState::PAUSED;
    if (s == "restarting") return ContainerState::RESTARTING;
    if (s == "exited" || s == "stopped") return ContainerState::EXITED;
    if (s == "dead" || s == "removing") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::string ContainerStateToString(ContainerState state) {
    switch (state) {
        case ContainerState::CREATED:    return "created";
        case ContainerState::RUNNING:    return "running";
        case ContainerState::PAUSED:     return "paused";
        case ContainerState::RESTARTING: return "restarting";
        case ContainerState::EXITED:     return "exited";
        case ContainerState::DEAD:       return "dead";
        default:                         return "unknown";
    }
}

// ============================================================================
// PROCESS EXECUTION
// ============================================================================
// popen with every argument quoted for /bin/sh, stderr folded into stdout

CommandResult DockerCli::RunProcess(const std::vector<std::string>& argv) {
    CommandResult result;

    std::vector<std::string> quoted;
    quoted.reserve(argv.size());
    for (const auto& arg : argv) {
        quoted.push_back(StringUtils::ShellQuote(arg));
    }
    std::string cmd = StringUtils::Join(quoted, " ") + " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.output = "Failed to execute command";
        return result;
    }

    std::array<char, 256> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
#ifndef _WIN32
    result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
#else
    result.exit_code = status;
#endif
    return result;
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerCli::DockerCli(std::string binary, CommandRunner runner)
    : binary_(std::move(binary))
    , runner_(runner ? std::move(runner) : CommandRunner(&DockerCli::RunProcess)) {
    spdlog::debug("Docker control plane using '{}'", binary_);
}

CommandResult DockerCli::Docker(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("docker {}", StringUtils::Join(args, " "));
    return runner_(argv);
}

bool DockerCli::IsNotFound(const std::string& output) {
    std::string lower = StringUtils::ToLower(output);
    return StringUtils::Contains(lower, "no such container") ||
           StringUtils::Contains(lower, "no such object") ||
           StringUtils::Contains(lower, "no such image");
}

// ============================================================================
// LOOKUP
// ============================================================================

std::optional<ContainerInfo> DockerCli::Inspect(const std::string& name_or_id) {
    auto result = Docker({"inspect", "--type", "container", "--format",
                          "{{.Id}}|{{.Name}}|{{.Config.Image}}|{{.State.Status}}",
                          name_or_id});

    if (result.exit_code != 0) {
        if (IsNotFound(result.output)) {
            return std::nullopt;
        }
        throw core::ControlPlaneError("docker inspect " + name_or_id + " failed: " +
                                      StringUtils::Trim(result.output));
    }

    auto fields = StringUtils::Split(StringUtils::Trim(result.output), '|');
    if (fields.size() < 4) {
        throw core::ControlPlaneError("Unexpected docker inspect output: " + result.output);
    }

    ContainerInfo info;
    info.id = fields[0];
    info.name = StringUtils::StartsWith(fields[1], "/") ? fields[1].substr(1) : fields[1];
    info.image = fields[2];
    info.state = ParseContainerState(fields[3]);
    return info;
}

bool DockerCli::ImageExists(const std::string& image) {
    auto result = Docker({"image", "inspect", "--format", "{{.Id}}", image});
    if (result.exit_code == 0) {
        return true;
    }
    if (IsNotFound(result.output)) {
        return false;
    }
    throw core::ControlPlaneError("docker image inspect " + image + " failed: " +
                                  StringUtils::Trim(result.output));
}

void DockerCli::PullImage(const std::string& image) {
    spdlog::info("Pulling image {}...", image);
    auto result = Docker({"pull", image});
    if (result.exit_code != 0) {
        throw core::ControlPlaneError("docker pull " + image + " failed: " +
                                      StringUtils::Trim(result.output));
    }
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::vector<std::string> DockerCli::BuildRunArgs(const ContainerSpec& spec) {
    std::vector<std::string> args = {"run", "-d", "--name", spec.name};

    if (spec.stop_timeout.count() > 0) {
        args.push_back("--stop-timeout");
        args.push_back(std::to_string(spec.stop_timeout.count()));
    }

    for (const auto& port : spec.ports) {
        args.push_back("-p");
        args.push_back(std::to_string(port.host_port) + ":" +
                       std::to_string(port.container_port) + "/tcp");
    }

    for (const auto& [key, value] : spec.environment) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& mount : spec.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path + ":" + mount.container_path +
                       (mount.read_only ? ":ro" : ""));
    }

    for (const auto& device : spec.devices) {
        args.push_back("--device");
        args.push_back(device);
    }

    for (const auto& cap : spec.capabilities_add) {
        args.push_back("--cap-add");
        args.push_back(cap);
    }

    args.push_back(spec.image);
    return args;
}

std::string DockerCli::Run(const ContainerSpec& spec) {
    spdlog::info("Creating container: {}", spec.name);

    auto result = Docker(BuildRunArgs(spec));
    if (result.exit_code != 0) {
        throw core::ControlPlaneError("docker run " + spec.name + " failed: " +
                                      StringUtils::Trim(result.output));
    }

    // Pull progress may precede the ID; the ID is always the last line
    std::string id;
    for (const auto& line : StringUtils::SplitLines(result.output)) {
        if (!StringUtils::Trim(line).empty()) {
            id = StringUtils::Trim(line);
        }
    }
    if (id.empty()) {
        throw core::ControlPlaneError("docker run " + spec.name + " returned no container ID");
    }

    spdlog::info("Container created: {}", id.substr(0, 12));
    return id;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void DockerCli::Start(const std::string& id) {
    auto result = Docker({"start", id});
    if (result.exit_code != 0) {
        throw core::ControlPlaneError("docker start " + id + " failed: " +
                                      StringUtils::Trim(result.output));
    }
}

void DockerCli::Restart(const std::string& id) {
    auto result = Docker({"restart", id});
    if (result.exit_code != 0) {
        throw core::ControlPlaneError("docker restart " + id + " failed: " +
                                      StringUtils::Trim(result.output));
    }
}

bool DockerCli::Stop(const std::string& id, std::chrono::seconds timeout) {
    auto result = Docker({"stop", "-t", std::to_string(timeout.count()), id});
    if (result.exit_code == 0) {
        return true;
    }
    if (IsNotFound(result.output)) {
        return false;
    }
    throw core::ControlPlaneError("docker stop " + id + " failed: " +
                                  StringUtils::Trim(result.output));
}

bool DockerCli::Remove(const std::string& id, bool force) {
    std::vector<std::string> args = {"rm", "-v"};
    if (force) {
        args.push_back("-f");
    }
    args.push_back(id);

    auto result = Docker(args);
    if (result.exit_code == 0) {
        return true;
    }
    if (IsNotFound(result.output)) {
        return false;
    }
    throw core::ControlPlaneError("docker rm " + id + " failed: " +
                                  StringUtils::Trim(result.output));
}

} // namespace utils
} // namespace vmbench
