#pragma once

/**
 * @file store.hpp
 * @brief Registry of transfer windows and the read/acknowledge protocol
 *
 * WHY THIS FILE EXISTS:
 * A consumer pulls a source one chunk at a time and must confirm each
 * chunk before the next one becomes readable. The store owns every
 * window and is the only thing that moves them.
 *
 * PROTOCOL:
 *   key = store.register_source(descriptor);   // emits Registered
 *   while (store.has_next(key)) {
 *       auto chunk = store.read_chunk(key);     // emits ChunkRead
 *       ... deliver chunk ...
 *       store.acknowledge_chunk(key);           // emits ChunkAcknowledged
 *   }
 *
 * THREAD SAFETY PATTERN:
 * - The key -> entry map is guarded by a std::shared_mutex and only held
 *   for lookups and insert/erase
 * - Each entry has its own mutex guarding its window, so transfers of
 *   different sources never serialise on one lock
 * - The byte source is called and events are emitted with no lock held
 */

#include "chunkgate/core/error.hpp"
#include "chunkgate/core/result.hpp"
#include "chunkgate/events/event_bus.hpp"
#include "chunkgate/events/events.hpp"
#include "chunkgate/transfer/byte_source.hpp"
#include "chunkgate/transfer/types.hpp"
#include "chunkgate/transfer/window.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace chunkgate::transfer {

class TransferStore {
public:
    static constexpr std::uint64_t kDefaultChunkSize = 16 * 1024;

    /**
     * @param chunk_size  Window size for every source; 0 falls back to
     *                    kDefaultChunkSize
     * @param source      Reader used by read_chunk
     * @param bus         Where TransferEvents are published
     */
    TransferStore(std::uint64_t chunk_size,
                  std::shared_ptr<ByteSource> source,
                  events::EventBus& bus);

    TransferStore(const TransferStore&) = delete;
    TransferStore& operator=(const TransferStore&) = delete;

    /**
     * Creates a window [0, min(chunk_size, total_length)) for the source
     * and emits Registered. A zero-length source is terminal right away.
     */
    SourceKey register_source(const SourceDescriptor& source);

    /// True iff the key exists and its window is not empty.
    [[nodiscard]] bool has_next(const SourceKey& key) const;

    /**
     * Returns the bytes of the current window without moving it.
     *
     * ERRORS:
     * NoSuchSource      - unknown key
     * EndOfData         - window is empty; the byte source is not contacted
     * SourceReadFailure - the byte source failed or returned the wrong length
     */
    Result<Bytes, TransferError> read_chunk(const SourceKey& key);

    /**
     * Advances the window past the current chunk and emits
     * ChunkAcknowledged. Call it once per delivered chunk: a second call
     * skips the next chunk unread.
     *
     * ERRORS:
     * NoSuchSource - unknown key
     * EndOfData    - window is empty; nothing is changed
     */
    Result<void, TransferError> acknowledge_chunk(const SourceKey& key);

    /**
     * Registers a TransferEvent callback. Callbacks run synchronously in
     * the emitting thread, in subscription order.
     */
    events::Subscription subscribe(std::function<void(const events::TransferEvent&)> callback);

    Result<WindowSnapshot, TransferError> window(const SourceKey& key) const;

    /// All windows, in registration order.
    std::vector<WindowSnapshot> snapshot() const;

    /// Drops a window. Completed windows are otherwise kept for inspection.
    Result<void, TransferError> discard(const SourceKey& key);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }

private:
    struct Entry {
        Entry(SourceDescriptor src, std::uint64_t chunk_size, std::uint64_t seq)
            : source(std::move(src)),
              window(source.total_length, chunk_size),
              sequence(seq) {}

        const SourceDescriptor source;
        TransferWindow window;
        const std::uint64_t sequence;
        mutable std::mutex mutex;
    };

    std::shared_ptr<Entry> find(const SourceKey& key) const;
    static SourceKey make_key(const std::string& name, std::uint64_t sequence);

    static WindowSnapshot make_snapshot(const SourceKey& key, const Entry& entry);

    const std::uint64_t chunk_size_;
    std::shared_ptr<ByteSource> source_;
    events::EventBus& bus_;

    std::atomic<std::uint64_t> sequence_{0};

    mutable std::shared_mutex mutex_;
    std::unordered_map<SourceKey, std::shared_ptr<Entry>> entries_;
};

} // namespace chunkgate::transfer
