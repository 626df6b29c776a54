/**
 * @file runner_config.cpp
 * @brief JSON loading for RunnerConfig
 *
 * @date 2025
 */

#include "vmbench/orchestrator/runner_config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace vmbench {
namespace orchestrator {

namespace {

template <typename T>
void Overlay(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

void OverlayPath(const json& j, const char* key, std::filesystem::path& target) {
    if (j.contains(key) && j[key].is_string()) {
        target = j[key].get<std::string>();
    }
}

void OverlaySeconds(const json& j, const char* key, std::chrono::duration<double>& target) {
    if (j.contains(key) && j[key].is_number()) {
        target = std::chrono::duration<double>(j[key].get<double>());
    }
}

} // namespace

void from_json(const json& j, RunnerConfig& config) {
    OverlayPath(j, "tasks_root", config.tasks_root);
    OverlayPath(j, "results_root", config.results_root);
    OverlayPath(j, "index_file", config.index_file);

    Overlay(j, "concurrency", config.concurrency);
    Overlay(j, "start_port", config.start_port);
    Overlay(j, "port_keys", config.port_keys);
    Overlay(j, "port_pool_file", config.port_pool_file);
    if (j.contains("job_timeout_seconds")) {
        config.job_timeout = std::chrono::seconds(j["job_timeout_seconds"].get<long>());
    }
    if (j.contains("poll_interval_ms")) {
        config.poll_interval = std::chrono::milliseconds(j["poll_interval_ms"].get<long>());
    }
    if (j.contains("cancel_grace_ms")) {
        config.cancel_grace = std::chrono::milliseconds(j["cancel_grace_ms"].get<long>());
    }

    if (j.contains("sandbox")) {
        const auto& sandbox = j["sandbox"];
        Overlay(sandbox, "image", config.image);
        OverlayPath(sandbox, "storage_root", config.storage_root);
        Overlay(sandbox, "vm_ram", config.vm_ram);
        Overlay(sandbox, "vm_cpu_cores", config.vm_cpu_cores);
        Overlay(sandbox, "vm_disk_size", config.vm_disk_size);
        Overlay(sandbox, "enable_debug", config.enable_debug);
        Overlay(sandbox, "preserve_on_exit", config.preserve_on_exit);
        OverlaySeconds(sandbox, "ready_timeout_seconds", config.ready_timeout);
        OverlaySeconds(sandbox, "ready_interval_seconds", config.ready_interval);
        Overlay(sandbox, "health_retries", config.health_retries);
        OverlaySeconds(sandbox, "health_delay_seconds", config.health_delay);
    }

    if (j.contains("shell")) {
        const auto& shell = j["shell"];
        Overlay(shell, "username", config.shell_username);
        if (shell.contains("password")) {
            config.shell_password = shell["password"].is_string()
                ? std::optional<std::string>(shell["password"].get<std::string>())
                : std::nullopt;
        }
        if (shell.contains("key_file") && shell["key_file"].is_string()) {
            config.shell_key_file = shell["key_file"].get<std::string>();
        }
        OverlaySeconds(shell, "initial_delay_seconds", config.shell_initial_delay);
    }

    if (j.contains("kernel")) {
        const auto& kernel = j["kernel"];
        Overlay(kernel, "retries", config.kernel_retries);
        OverlaySeconds(kernel, "delay_seconds", config.kernel_delay);
        Overlay(kernel, "preinstall_packages", config.preinstall_packages);
    }
}

RunnerConfig LoadRunnerConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    RunnerConfig config;
    try {
        json j;
        file >> j;
        from_json(j, config);
    }
    catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }

    spdlog::info("Loaded configuration from {}", path.string());
    return config;
}

} // namespace orchestrator
} // namespace vmbench
