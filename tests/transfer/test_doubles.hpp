#pragma once

#include "chunkgate/transfer/byte_source.hpp"
#include "chunkgate/transfer/chunk_sink.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkgate::testing {

using transfer::Bytes;

inline Bytes make_pattern(std::size_t length) {
    Bytes data(length);
    for (std::size_t i = 0; i < length; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31 + 7) % 251);
    }
    return data;
}

/**
 * In-memory byte source. Ranges starting at an offset registered with
 * fail_at() fail that many times before succeeding.
 */
class MemoryByteSource : public transfer::ByteSource {
public:
    void add(const std::string& id, Bytes data) {
        std::lock_guard lock(mutex_);
        sources_[id] = std::move(data);
    }

    void fail_at(std::uint64_t start, std::size_t times) {
        std::lock_guard lock(mutex_);
        failures_[start] = times;
    }

    void truncate_reads(bool enabled) {
        std::lock_guard lock(mutex_);
        truncate_ = enabled;
    }

    std::size_t read_count() const {
        std::lock_guard lock(mutex_);
        return reads_;
    }

    Result<Bytes> read(const std::string& source_id, std::uint64_t start, std::uint64_t end) override {
        std::lock_guard lock(mutex_);
        ++reads_;

        auto failure = failures_.find(start);
        if (failure != failures_.end() && failure->second > 0) {
            --failure->second;
            return Err<Bytes>(std::string("injected failure at ") + std::to_string(start));
        }

        auto it = sources_.find(source_id);
        if (it == sources_.end() || end > it->second.size() || start > end) {
            return Err<Bytes>(std::string("bad range for ") + source_id);
        }

        Bytes out(it->second.begin() + static_cast<std::ptrdiff_t>(start),
                  it->second.begin() + static_cast<std::ptrdiff_t>(end));
        if (truncate_ && !out.empty()) {
            out.pop_back();
        }
        return Ok(std::move(out));
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bytes> sources_;
    std::map<std::uint64_t, std::size_t> failures_;
    bool truncate_ = false;
    std::size_t reads_ = 0;
};

/**
 * What a RecordingSink saw; owned by the test so it survives the sink.
 */
struct SinkRecord {
    std::mutex mutex;
    Bytes data;
    std::size_t writes = 0;
    std::size_t closes = 0;
    std::size_t failing_writes = 0;  ///< Next N writes fail
};

class RecordingSink : public transfer::ChunkSink {
public:
    explicit RecordingSink(std::shared_ptr<SinkRecord> record) : record_(std::move(record)) {}

    Result<void> write(const Bytes& chunk) override {
        std::lock_guard lock(record_->mutex);
        if (record_->failing_writes > 0) {
            --record_->failing_writes;
            return Err<void>(std::string("injected write failure"));
        }
        ++record_->writes;
        record_->data.insert(record_->data.end(), chunk.begin(), chunk.end());
        return Ok();
    }

    Result<void> close() override {
        std::lock_guard lock(record_->mutex);
        ++record_->closes;
        return Ok();
    }

private:
    std::shared_ptr<SinkRecord> record_;
};

/**
 * Factory handing out RecordingSinks and remembering one record per name.
 */
class RecordingSinkFactory {
public:
    transfer::ChunkSinkFactory factory() {
        return [this](const std::string& name) -> Result<std::unique_ptr<transfer::ChunkSink>> {
            std::lock_guard lock(mutex_);
            if (fail_open_) {
                return Err<std::unique_ptr<transfer::ChunkSink>>(std::string("sink refused"));
            }
            auto record = std::make_shared<SinkRecord>();
            record->failing_writes = failing_writes_;
            records_[name] = record;
            return Ok(std::unique_ptr<transfer::ChunkSink>(std::make_unique<RecordingSink>(record)));
        };
    }

    void fail_open(bool enabled) {
        std::lock_guard lock(mutex_);
        fail_open_ = enabled;
    }

    void fail_writes(std::size_t count) {
        std::lock_guard lock(mutex_);
        failing_writes_ = count;
    }

    std::shared_ptr<SinkRecord> record(const std::string& name) {
        std::lock_guard lock(mutex_);
        auto it = records_.find(name);
        return it == records_.end() ? nullptr : it->second;
    }

    std::size_t opened() const {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SinkRecord>> records_;
    bool fail_open_ = false;
    std::size_t failing_writes_ = 0;
};

} // namespace chunkgate::testing
