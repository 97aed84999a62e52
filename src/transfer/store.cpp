#include "chunkgate/transfer/store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <sstream>

namespace chunkgate::transfer {
namespace {

std::uint64_t effective_chunk_size(std::uint64_t requested) {
    if (requested == 0) {
        spdlog::warn("Chunk size 0 requested, using {} bytes", TransferStore::kDefaultChunkSize);
        return TransferStore::kDefaultChunkSize;
    }
    return requested;
}

} // namespace

TransferStore::TransferStore(std::uint64_t chunk_size,
                             std::shared_ptr<ByteSource> source,
                             events::EventBus& bus)
    : chunk_size_(effective_chunk_size(chunk_size)),
      source_(std::move(source)),
      bus_(bus) {}

SourceKey TransferStore::register_source(const SourceDescriptor& source) {
    const auto sequence = ++sequence_;
    SourceKey key = make_key(source.name, sequence);
    {
        std::unique_lock lock(mutex_);
        entries_[key] = std::make_shared<Entry>(source, chunk_size_, sequence);
    }

    spdlog::debug("Registered {} ({} bytes, chunk size {})", key, source.total_length, chunk_size_);
    bus_.emit(events::TransferEvent{key, events::TransferEventKind::Registered});
    return key;
}

bool TransferStore::has_next(const SourceKey& key) const {
    auto entry = find(key);
    if (!entry) {
        return false;
    }
    std::lock_guard lock(entry->mutex);
    return entry->window.has_next();
}

Result<Bytes, TransferError> TransferStore::read_chunk(const SourceKey& key) {
    auto entry = find(key);
    if (!entry) {
        return Err<Bytes>(TransferError::NoSuchSource);
    }

    std::uint64_t left = 0;
    std::uint64_t right = 0;
    {
        std::lock_guard lock(entry->mutex);
        if (!entry->window.has_next()) {
            return Err<Bytes>(TransferError::EndOfData);
        }
        left = entry->window.left();
        right = entry->window.right();
    }

    auto bytes = source_->read(entry->source.id, left, right);
    if (bytes.is_error()) {
        spdlog::warn("Read of [{}, {}) from {} failed: {}", left, right, key, bytes.error());
        return Err<Bytes>(TransferError::SourceReadFailure);
    }
    if (bytes.value().size() != right - left) {
        spdlog::warn("Read of [{}, {}) from {} returned {} bytes", left, right, key, bytes.value().size());
        return Err<Bytes>(TransferError::SourceReadFailure);
    }

    bus_.emit(events::TransferEvent{key, events::TransferEventKind::ChunkRead});
    return Ok<Bytes, TransferError>(std::move(bytes.value()));
}

Result<void, TransferError> TransferStore::acknowledge_chunk(const SourceKey& key) {
    auto entry = find(key);
    if (!entry) {
        return Err<void>(TransferError::NoSuchSource);
    }

    {
        std::lock_guard lock(entry->mutex);
        auto advanced = entry->window.advance();
        if (advanced.is_error()) {
            return advanced;
        }
    }

    bus_.emit(events::TransferEvent{key, events::TransferEventKind::ChunkAcknowledged});
    return Ok<TransferError>();
}

events::Subscription TransferStore::subscribe(std::function<void(const events::TransferEvent&)> callback) {
    return bus_.subscribe<events::TransferEvent>(std::move(callback));
}

Result<WindowSnapshot, TransferError> TransferStore::window(const SourceKey& key) const {
    auto entry = find(key);
    if (!entry) {
        return Err<WindowSnapshot>(TransferError::NoSuchSource);
    }
    std::lock_guard lock(entry->mutex);
    return Ok<WindowSnapshot, TransferError>(make_snapshot(key, *entry));
}

std::vector<WindowSnapshot> TransferStore::snapshot() const {
    std::vector<std::pair<SourceKey, std::shared_ptr<Entry>>> entries;
    {
        std::shared_lock lock(mutex_);
        entries.assign(entries_.begin(), entries_.end());
    }

    std::vector<WindowSnapshot> result;
    result.reserve(entries.size());
    for (const auto& [key, entry] : entries) {
        std::lock_guard lock(entry->mutex);
        result.push_back(make_snapshot(key, *entry));
    }

    std::sort(result.begin(), result.end(), [](const WindowSnapshot& a, const WindowSnapshot& b) {
        return a.sequence < b.sequence;
    });
    return result;
}

Result<void, TransferError> TransferStore::discard(const SourceKey& key) {
    std::unique_lock lock(mutex_);
    if (entries_.erase(key) == 0) {
        return Err<void>(TransferError::NoSuchSource);
    }
    return Ok<TransferError>();
}

std::size_t TransferStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

std::shared_ptr<TransferStore::Entry> TransferStore::find(const SourceKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

SourceKey TransferStore::make_key(const std::string& name, std::uint64_t sequence) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    // The sequence keeps keys unique when name and millisecond coincide.
    std::ostringstream oss;
    oss << name << "-" << millis << "-" << sequence;
    return oss.str();
}

WindowSnapshot TransferStore::make_snapshot(const SourceKey& key, const Entry& entry) {
    WindowSnapshot snapshot;
    snapshot.key = key;
    snapshot.name = entry.source.name;
    snapshot.left = entry.window.left();
    snapshot.right = entry.window.right();
    snapshot.total_length = entry.window.total_length();
    snapshot.chunk_size = entry.window.chunk_size();
    snapshot.sequence = entry.sequence;
    snapshot.chunk_index = entry.window.chunk_index();
    snapshot.chunk_count = entry.window.chunk_count();
    snapshot.bytes_acknowledged = entry.window.left();
    return snapshot;
}

} // namespace chunkgate::transfer
