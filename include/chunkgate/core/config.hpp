#pragma once

#include "chunkgate/core/result.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkgate {

/**
 * @brief Runtime settings for a transfer process
 *
 * JSON form (every key optional):
 * {
 *   "chunk_size": 16384,
 *   "max_failures": 3,
 *   "worker_threads": 2,
 *   "output_dir": "received",
 *   "log_level": "info",
 *   "history_size": 5
 * }
 */
struct TransferConfig {
    std::uint64_t chunk_size = 16 * 1024;
    std::size_t max_failures = 3;
    std::size_t worker_threads = 2;
    std::filesystem::path output_dir = "received";
    std::string log_level = "info";
    std::size_t history_size = 5;
};

Result<TransferConfig> parse_config(const std::string& text);

Result<TransferConfig> load_config(const std::filesystem::path& path);

/// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace chunkgate
