#include "chunkgate/core/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace chunkgate {
namespace {

using json = nlohmann::json;

// Reads an optional positive integer. Negative and fractional numbers are
// rejected rather than converted.
template <typename T>
Result<T> read_count(const json& payload, const char* key, T fallback) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return Ok<T>(fallback);
    }
    if (!it->is_number_unsigned()) {
        return Err<T>(std::string(key) + " must be a positive integer");
    }
    const auto value = it->get<std::uint64_t>();
    if (value == 0) {
        return Err<T>(std::string(key) + " must be > 0");
    }
    if (value > std::numeric_limits<T>::max()) {
        return Err<T>(std::string(key) + " is out of range");
    }
    return Ok<T>(static_cast<T>(value));
}

Result<void> validate(const TransferConfig& config) {
    if (auto level = parse_log_level(config.log_level); level.is_error()) {
        return Err<void>(level.error());
    }
    return Ok();
}

} // namespace

Result<TransferConfig> parse_config(const std::string& text) {
    auto payload = json::parse(text, nullptr, false);
    if (payload.is_discarded()) {
        return Err<TransferConfig>(std::string("Config is not valid JSON"));
    }
    if (!payload.is_object()) {
        return Err<TransferConfig>(std::string("Config root must be an object"));
    }

    TransferConfig config;

    auto chunk_size = read_count(payload, "chunk_size", config.chunk_size);
    if (chunk_size.is_error()) {
        return Err<TransferConfig>(chunk_size.error());
    }
    auto max_failures = read_count(payload, "max_failures", config.max_failures);
    if (max_failures.is_error()) {
        return Err<TransferConfig>(max_failures.error());
    }
    auto worker_threads = read_count(payload, "worker_threads", config.worker_threads);
    if (worker_threads.is_error()) {
        return Err<TransferConfig>(worker_threads.error());
    }
    auto history_size = read_count(payload, "history_size", config.history_size);
    if (history_size.is_error()) {
        return Err<TransferConfig>(history_size.error());
    }
    config.chunk_size = chunk_size.value();
    config.max_failures = max_failures.value();
    config.worker_threads = worker_threads.value();
    config.history_size = history_size.value();

    try {
        config.output_dir = payload.value("output_dir", config.output_dir.string());
        config.log_level = payload.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<TransferConfig>(std::string("Invalid config value: ") + e.what());
    }

    if (auto valid = validate(config); valid.is_error()) {
        return Err<TransferConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<TransferConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<TransferConfig>(std::string("Failed to open config file: ") + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str maps anything unknown to off
    if (level == spdlog::level::off && name != "off") {
        return Err<spdlog::level::level_enum>(std::string("Unknown log level: ") + name);
    }
    return Ok(level);
}

} // namespace chunkgate
