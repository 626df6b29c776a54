/**
 * @file port_pool.cpp
 * @brief Port block generation
 *
 * @date 2025
 */

#include "vmbench/orchestrator/port_pool.hpp"
#include "vmbench/core/sandbox_descriptor.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace vmbench {
namespace orchestrator {

const std::vector<std::string>& DefaultPortKeys() {
    static const std::vector<std::string> keys = {
        core::port_keys::kShell,
        core::port_keys::kDisplay,
        core::port_keys::kObservation,
        core::port_keys::kKernel
    };
    return keys;
}

std::vector<PortBlock> GeneratePortPool(int start_port, int concurrency,
                                        const std::vector<std::string>& keys) {
    if (keys.empty()) {
        throw std::invalid_argument("Port pool needs at least one key");
    }
    if (start_port < 1) {
        throw std::invalid_argument("Invalid start port " + std::to_string(start_port));
    }

    const int slots = std::max(1, concurrency);
    const int width = static_cast<int>(keys.size());
    const long last = static_cast<long>(start_port) + static_cast<long>(slots) * width - 1;
    if (last > 65535) {
        throw std::invalid_argument("Port pool exceeds 65535 (last port " +
                                    std::to_string(last) + ")");
    }

    std::vector<PortBlock> pool;
    pool.reserve(slots);
    for (int i = 0; i < slots; ++i) {
        PortBlock block;
        for (int k = 0; k < width; ++k) {
            block[keys[k]] = start_port + i * width + k;
        }
        pool.push_back(std::move(block));
    }

    spdlog::debug("Generated {} port block(s) from {}", slots, start_port);
    return pool;
}

void SavePortPool(const std::vector<PortBlock>& pool, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    file << nlohmann::json(pool).dump(2);
    spdlog::info("Port pool saved to: {}", path.string());
}

} // namespace orchestrator
} // namespace vmbench
