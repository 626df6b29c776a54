/**
 * @file sandbox_descriptor.cpp
 * @brief Sandbox descriptor construction and validation
 *
 * @date 2025
 */

#include "vmbench/core/sandbox_descriptor.hpp"
#include "vmbench/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <stdexcept>
#include <utility>

namespace vmbench {
namespace core {

namespace {

const std::map<std::string, int>& CanonicalPorts() {
    static const std::map<std::string, int> ports = {
        {port_keys::kShell, 22},
        {port_keys::kDisplay, 8006},
        {port_keys::kObservation, 8765},
        {port_keys::kKernel, 8888},
    };
    return ports;
}

bool IsValidPort(int port) {
    return port > 0 && port <= 65535;
}

} // anonymous namespace

std::optional<int> CanonicalGuestPort(const std::string& key) {
    auto it = CanonicalPorts().find(key);
    if (it == CanonicalPorts().end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

SandboxDescriptor::SandboxDescriptor(SandboxOptions options)
    : options_(std::move(options)) {

    // Additional entries first so canonical keys always win
    ports_ = options_.additional_ports;
    for (const auto& [key, guest_port] : CanonicalPorts()) {
        auto host = options_.host_ports.find(key);
        int host_port = host != options_.host_ports.end() ? host->second : guest_port;
        ports_[key] = PortMapping{guest_port, host_port};
    }

    storage_root_ = std::filesystem::absolute(options_.storage_root);
    host_shared_dir_ = std::filesystem::absolute(options_.shared_dir);
    if (options_.shared_dir_suffix && !options_.shared_dir_suffix->empty()) {
        host_shared_dir_ /= *options_.shared_dir_suffix;
    }

    runtime_env_ = options_.runtime_env;
    runtime_env_["SHARED_DIR"] = GuestSharedDir();
}

SandboxDescriptor SandboxDescriptor::Create(const SandboxOptions& options) {
    if (options.name.empty()) {
        throw SandboxCreationError("Sandbox name must not be empty");
    }

    SandboxDescriptor descriptor(options);

    try {
        std::filesystem::create_directories(descriptor.storage_root_ / "sandboxes");
        std::filesystem::create_directories(descriptor.host_shared_dir_);
    }
    catch (const std::filesystem::filesystem_error& e) {
        throw SandboxCreationError(std::string("Failed to create sandbox directories: ") +
                                   e.what());
    }

    descriptor.Validate();

    spdlog::debug("Sandbox descriptor '{}' ready (shared dir: {})",
                  descriptor.Name(), descriptor.host_shared_dir_.string());
    return descriptor;
}

// ============================================================================
// VALIDATION
// ============================================================================

void SandboxDescriptor::Validate() const {
    if (options_.name.empty()) {
        throw SandboxCreationError("Sandbox name must not be empty");
    }
    if (options_.vm_cpu_cores <= 0) {
        throw SandboxCreationError("CPU core count must be positive");
    }

    std::set<int> seen_host_ports;
    for (const auto& [key, mapping] : ports_) {
        if (!IsValidPort(mapping.guest_port)) {
            throw SandboxCreationError("Invalid guest port " +
                                       std::to_string(mapping.guest_port) +
                                       " for '" + key + "'");
        }
        if (!IsValidPort(mapping.host_port)) {
            throw SandboxCreationError("Invalid host port " +
                                       std::to_string(mapping.host_port) +
                                       " for '" + key + "'");
        }
        if (!seen_host_ports.insert(mapping.host_port).second) {
            throw SandboxCreationError("Host port " + std::to_string(mapping.host_port) +
                                       " assigned twice (at '" + key + "')");
        }
    }

    if (!std::filesystem::is_regular_file(BaseDataImage())) {
        throw SandboxCreationError("Base disk image not found: " + BaseDataImage().string());
    }
    if (!std::filesystem::is_directory(host_shared_dir_)) {
        throw SandboxCreationError("Shared directory missing: " + host_shared_dir_.string());
    }
}

// ============================================================================
// ACCESSORS
// ============================================================================

int SandboxDescriptor::HostPort(const std::string& key) const {
    auto it = ports_.find(key);
    if (it == ports_.end()) {
        throw std::out_of_range("No port mapped for '" + key + "'");
    }
    return it->second.host_port;
}

std::filesystem::path SandboxDescriptor::BaseDataImage() const {
    return storage_root_ / "vms" / "ubuntu-base" / "storage" / "data.img";
}

std::filesystem::path SandboxDescriptor::InstanceDir() const {
    return storage_root_ / "sandboxes" / options_.name;
}

std::filesystem::path SandboxDescriptor::InstanceDataImage() const {
    return InstanceDir() / "data.img";
}

std::string SandboxDescriptor::GuestSetupLog() const {
    return GuestSharedDir() + "/" + options_.setup_log_name;
}

std::string SandboxDescriptor::GuestObservationLog() const {
    return GuestSharedDir() + "/" + options_.observation_log_name;
}

} // namespace core
} // namespace vmbench
