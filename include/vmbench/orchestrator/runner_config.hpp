/**
 * @file runner_config.hpp
 * @brief Orchestrator configuration
 *
 * Plain struct with defaults; loadable from JSON where missing keys keep
 * their defaults. Command-line flags override individual fields.
 *
 * **Example** (`vmbench.json`):
 * ```json
 * {
 *   "tasks_root": "tasks",
 *   "results_root": "results",
 *   "concurrency": 4,
 *   "job_timeout_seconds": 720,
 *   "sandbox": { "image": "qemux/qemu", "vm_ram": "8G" },
 *   "shell": { "username": "user", "password": "password" }
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vmbench {
namespace orchestrator {

/**
 * @struct RunnerConfig
 * @brief Everything RunAll needs besides the job body
 */
struct RunnerConfig {
    // Paths
    std::filesystem::path tasks_root{"tasks"};                ///< Job definitions
    std::filesystem::path results_root{"results"};            ///< Job outputs
    std::filesystem::path index_file{"tasks/index.json"};     ///< {tool: [uid, ...]}

    // Scheduling
    int concurrency{1};                                       ///< Parallel sandboxes
    int start_port{60000};                                    ///< First host port of the pool
    std::vector<std::string> port_keys{"ssh", "vnc", "observation", "kernel"};
    std::string port_pool_file{"port_pool.json"};             ///< Written under results_root
    std::chrono::seconds job_timeout{720};                    ///< Per-job deadline
    std::chrono::milliseconds poll_interval{1000};            ///< Supervisor polling
    std::chrono::milliseconds cancel_grace{30000};            ///< Wait for worker after timeout

    // Sandbox
    std::string image{"qemux/qemu"};
    std::filesystem::path storage_root{"docker"};
    std::string vm_ram{"4G"};
    int vm_cpu_cores{4};
    std::string vm_disk_size{"25g"};
    bool enable_debug{false};
    bool preserve_on_exit{false};                             ///< Keep sandboxes after jobs

    // Shell
    std::string shell_username{"user"};
    std::optional<std::string> shell_password{"password"};
    std::optional<std::string> shell_key_file;
    std::chrono::duration<double> shell_initial_delay{15.0};

    // Readiness
    std::chrono::duration<double> ready_timeout{300.0};
    std::chrono::duration<double> ready_interval{5.0};
    int health_retries{15};
    std::chrono::duration<double> health_delay{10.0};

    // Kernel
    int kernel_retries{5};
    std::chrono::duration<double> kernel_delay{5.0};
    std::vector<std::string> preinstall_packages;             ///< pip packages for every job
};

/// Overlay JSON keys onto an existing config
void from_json(const nlohmann::json& j, RunnerConfig& config);

/**
 * @brief Load a config file over the defaults
 * @throws std::runtime_error if the file cannot be read or parsed
 */
RunnerConfig LoadRunnerConfig(const std::filesystem::path& path);

} // namespace orchestrator
} // namespace vmbench
