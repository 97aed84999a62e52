#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkgate::transfer {

using Bytes = std::vector<std::uint8_t>;

/**
 * @brief Opaque, process-unique identity of a registered source
 */
using SourceKey = std::string;

/**
 * @brief What the store needs to know about a source at registration
 */
struct SourceDescriptor {
    std::string id;              ///< Handed to the ByteSource (a file path for files)
    std::string name;            ///< Display name, prefix of the SourceKey
    std::uint64_t total_length = 0;
};

/**
 * @brief Point-in-time copy of one registered window
 */
struct WindowSnapshot {
    SourceKey key;
    std::string name;
    std::uint64_t left = 0;
    std::uint64_t right = 0;
    std::uint64_t total_length = 0;
    std::uint64_t chunk_size = 0;
    std::uint64_t sequence = 0;  ///< Registration order
    std::uint64_t chunk_index = 0;
    std::uint64_t chunk_count = 0;
    std::uint64_t bytes_acknowledged = 0;
};

enum class TransferOutcome {
    Completed,
    Abandoned,
    SinkUnavailable
};

/**
 * @brief Result of one driver run over a single source
 */
struct TransferReport {
    SourceKey key;
    TransferOutcome outcome = TransferOutcome::Completed;
    std::size_t chunks_delivered = 0;
    std::uint64_t bytes_delivered = 0;
    std::size_t failures = 0;       ///< Consecutive failures when the loop ended
    std::string last_error;         ///< Empty when nothing failed
    std::chrono::milliseconds duration{0};
};

inline const char* to_string(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Completed: return "completed";
        case TransferOutcome::Abandoned: return "abandoned";
        case TransferOutcome::SinkUnavailable: return "sink-unavailable";
    }
    return "unknown";
}

} // namespace chunkgate::transfer
