/**
 * @file port_pool.hpp
 * @brief Disjoint host-port blocks for concurrent sandboxes
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace vmbench {
namespace orchestrator {

/// Logical port key -> host port
using PortBlock = std::map<std::string, int>;

/// Default keys, in allocation order
const std::vector<std::string>& DefaultPortKeys();

/**
 * @brief Generate one port block per concurrency slot
 *
 * Block i maps keys[k] to start + i * keys.size() + k, so blocks never
 * overlap. A concurrency below 1 is treated as 1.
 *
 * @throws std::invalid_argument if keys is empty or a port exceeds 65535
 */
std::vector<PortBlock> GeneratePortPool(int start_port, int concurrency,
                                        const std::vector<std::string>& keys = DefaultPortKeys());

/// Write the pool as an indented JSON array
void SavePortPool(const std::vector<PortBlock>& pool, const std::filesystem::path& path);

} // namespace orchestrator
} // namespace vmbench
