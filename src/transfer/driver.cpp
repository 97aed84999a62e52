#include "chunkgate/transfer/driver.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <memory>
#include <string>

namespace chunkgate::transfer {
namespace {

// Closes the sink when the scope ends unless close() was already called.
class SinkGuard {
public:
    explicit SinkGuard(std::unique_ptr<ChunkSink> sink) : sink_(std::move(sink)) {}

    ~SinkGuard() {
        if (!closed_) {
            auto result = sink_->close();
            if (result.is_error()) {
                spdlog::error("Failed to close sink: {}", result.error());
            }
        }
    }

    SinkGuard(const SinkGuard&) = delete;
    SinkGuard& operator=(const SinkGuard&) = delete;

    Result<void> write(const Bytes& chunk) { return sink_->write(chunk); }

    Result<void> close() {
        closed_ = true;
        return sink_->close();
    }

private:
    std::unique_ptr<ChunkSink> sink_;
    bool closed_ = false;
};

std::size_t worker_count(std::size_t requested) {
    return requested == 0 ? 1 : requested;
}

} // namespace

TransferDriver::TransferDriver(TransferStore& store,
                               events::EventBus& bus,
                               ChunkSinkFactory sink_factory,
                               DriverOptions options)
    : store_(store),
      bus_(bus),
      sink_factory_(std::move(sink_factory)),
      options_(options),
      pool_(worker_count(options.worker_threads)) {
    subscription_ = store_.subscribe([this](const events::TransferEvent& e) {
        if (e.kind == events::TransferEventKind::Registered) {
            schedule(e.key);
        }
    });
}

TransferDriver::~TransferDriver() {
    stop();
    wait_idle();
    pool_.join();
}

void TransferDriver::stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    subscription_.unsubscribe();
}

void TransferDriver::schedule(const SourceKey& key) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            spdlog::debug("[{}] Driver stopping, transfer not scheduled", key);
            return;
        }
        ++in_flight_;
    }

    boost::asio::post(pool_, [this, key]() {
        try {
            auto report = run(key);
            std::lock_guard lock(mutex_);
            reports_.push_back(std::move(report));
        } catch (const std::exception& e) {
            spdlog::error("Transfer {} aborted: {}", key, e.what());
        }

        {
            std::lock_guard lock(mutex_);
            --in_flight_;
        }
        idle_cv_.notify_all();
    });
}

TransferReport TransferDriver::run(const SourceKey& key) {
    const auto started = std::chrono::steady_clock::now();
    TransferReport report;
    report.key = key;

    auto elapsed = [&started]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    };

    auto window = store_.window(key);
    if (window.is_error()) {
        spdlog::error("[{}] Cannot start transfer: {}", key, to_string(window.error()));
        report.outcome = TransferOutcome::Abandoned;
        report.last_error = std::string(to_string(window.error()));
        bus_.emit(events::TransferAbandonedEvent{key, 0, report.last_error, 0});
        return report;
    }
    const std::uint64_t total_bytes = window.value().total_length;

    auto opened = sink_factory_(key);
    if (opened.is_error()) {
        spdlog::error("[{}] No sink available: {}", key, opened.error());
        report.outcome = TransferOutcome::SinkUnavailable;
        report.last_error = opened.error();
        report.duration = elapsed();
        bus_.emit(events::TransferAbandonedEvent{key, 0, report.last_error, 0});
        return report;
    }
    SinkGuard sink(std::move(opened.value()));

    spdlog::info("[{}] Transfer started ({} bytes)", key, total_bytes);
    bus_.emit(events::TransferStartedEvent{key, total_bytes});

    std::size_t failures = 0;
    while (store_.has_next(key) && failures < options_.max_failures) {
        auto chunk = store_.read_chunk(key);
        if (chunk.is_error()) {
            ++failures;
            report.last_error = std::string("read: ") + std::string(to_string(chunk.error()));
            spdlog::warn("[{}] Read failed ({}/{}): {}", key, failures, options_.max_failures,
                         to_string(chunk.error()));
            continue;
        }

        auto written = sink.write(chunk.value());
        if (written.is_error()) {
            ++failures;
            report.last_error = std::string("write: ") + written.error();
            spdlog::warn("[{}] Write failed ({}/{}): {}", key, failures, options_.max_failures,
                         written.error());
            continue;
        }

        auto acknowledged = store_.acknowledge_chunk(key);
        if (acknowledged.is_error()) {
            ++failures;
            report.last_error = std::string("acknowledge: ") + std::string(to_string(acknowledged.error()));
            spdlog::warn("[{}] Acknowledge failed ({}/{}): {}", key, failures, options_.max_failures,
                         to_string(acknowledged.error()));
            continue;
        }

        failures = 0;
        ++report.chunks_delivered;
        report.bytes_delivered += chunk.value().size();
    }

    report.failures = failures;
    report.outcome = failures >= options_.max_failures ? TransferOutcome::Abandoned
                                                       : TransferOutcome::Completed;

    auto closed = sink.close();
    if (closed.is_error()) {
        spdlog::error("[{}] Failed to close sink: {}", key, closed.error());
        report.last_error = std::string("close: ") + closed.error();
    }

    report.duration = elapsed();

    if (report.outcome == TransferOutcome::Completed) {
        spdlog::info("[{}] Transfer completed: {} chunks, {} bytes in {}ms",
                     key, report.chunks_delivered, report.bytes_delivered, report.duration.count());
        bus_.emit(events::TransferCompletedEvent{key, report.chunks_delivered, report.bytes_delivered,
                                                 report.duration});
    } else {
        spdlog::error("[{}] Transfer abandoned after {} consecutive failures: {} chunks, {} bytes delivered",
                      key, failures, report.chunks_delivered, report.bytes_delivered);
        bus_.emit(events::TransferAbandonedEvent{key, failures, report.last_error, report.bytes_delivered});
    }

    return report;
}

void TransferDriver::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this]() { return in_flight_ == 0; });
}

std::vector<TransferReport> TransferDriver::reports() const {
    std::lock_guard lock(mutex_);
    return reports_;
}

} // namespace chunkgate::transfer
