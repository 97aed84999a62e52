/**
 * @file events.hpp
 * @brief Event type definitions for chunk transfers
 *
 * NAMING CONVENTION:
 * - Events are past-tense: TransferStartedEvent, TransferCompletedEvent
 *
 * TransferEvent carries only the key. Subscribers that need the window
 * re-read it from the store.
 */

#pragma once

#include "chunkgate/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkgate::events {

// ════════════════════════════════════════════════════════
// Store Events
// ════════════════════════════════════════════════════════

enum class TransferEventKind {
    Registered,
    ChunkRead,
    ChunkAcknowledged
};

inline const char* to_string(TransferEventKind kind) {
    switch (kind) {
        case TransferEventKind::Registered: return "registered";
        case TransferEventKind::ChunkRead: return "chunk-read";
        case TransferEventKind::ChunkAcknowledged: return "chunk-acknowledged";
    }
    return "unknown";
}

/**
 * @brief Emitted by TransferStore for every state-relevant operation
 *
 * WHO EMITS:
 * - TransferStore::register_source (Registered)
 * - TransferStore::read_chunk (ChunkRead)
 * - TransferStore::acknowledge_chunk (ChunkAcknowledged)
 *
 * WHO SUBSCRIBES:
 * - TransferDriver (starts a transfer on Registered)
 * - LoggerComponent, MetricsComponent, EventHistory
 */
struct TransferEvent {
    transfer::SourceKey key;
    TransferEventKind kind;
};

// ════════════════════════════════════════════════════════
// Driver Events
// ════════════════════════════════════════════════════════

struct TransferStartedEvent {
    transfer::SourceKey key;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferCompletedEvent {
    transfer::SourceKey key;
    std::size_t chunks = 0;
    std::uint64_t bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a driver gives up on a source
 *
 * Covers both an exhausted failure budget and a sink that could not be
 * opened. The window stays where the last acknowledgement left it.
 */
struct TransferAbandonedEvent {
    transfer::SourceKey key;
    std::size_t failures = 0;
    std::string last_error;
    std::uint64_t bytes = 0;  ///< Bytes delivered before giving up
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace chunkgate::events
