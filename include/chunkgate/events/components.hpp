/**
 * @file components.hpp
 * @brief Reusable event-driven components
 *
 * WHY THIS FILE EXISTS:
 * Ready-made subscribers for the transfer events: logging, counters, and
 * a short history used by the status report.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * EventHistory history(bus, 5);
 *
 * Components unsubscribe when destroyed, so they must not outlive the bus.
 */

#pragma once

#include "chunkgate/events/event_bus.hpp"
#include "chunkgate/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace chunkgate::events {

/**
 * @brief Logger component - logs all transfer events
 *
 * Chunk-level events go to debug, lifecycle events to info/warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe<TransferEvent>([this](const TransferEvent& e) {
            on_transfer_event(e);
        }));

        subscriptions_.push_back(bus.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            on_transfer_started(e);
        }));

        subscriptions_.push_back(bus.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        }));

        subscriptions_.push_back(bus.subscribe<TransferAbandonedEvent>([this](const TransferAbandonedEvent& e) {
            on_transfer_abandoned(e);
        }));
    }

    ~LoggerComponent() {
        for (auto& subscription : subscriptions_) {
            subscription.unsubscribe();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_transfer_event(const TransferEvent& e) {
        if (e.kind == TransferEventKind::Registered) {
            spdlog::info("[Registered] key={}", e.key);
        } else {
            spdlog::debug("[{}] key={}", to_string(e.kind), e.key);
        }
    }

    void on_transfer_started(const TransferStartedEvent& e) {
        spdlog::info("[TransferStarted] key={} bytes={}", e.key, e.total_bytes);
    }

    void on_transfer_completed(const TransferCompletedEvent& e) {
        spdlog::info("[TransferCompleted] key={} chunks={} bytes={} duration={}ms",
                     e.key, e.chunks, e.bytes, e.duration.count());
    }

    void on_transfer_abandoned(const TransferAbandonedEvent& e) {
        spdlog::warn("[TransferAbandoned] key={} failures={} bytes={} error={}",
                     e.key, e.failures, e.bytes, e.last_error);
    }

    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Metrics component - tracks statistics
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * const auto& stats = metrics.get_stats();
 * spdlog::info("Chunks acknowledged: {}", stats.chunks_acknowledged.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sources_registered{0};
        std::atomic<uint64_t> chunks_read{0};
        std::atomic<uint64_t> chunks_acknowledged{0};
        std::atomic<uint64_t> transfers_started{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> transfers_abandoned{0};
        std::atomic<uint64_t> bytes_delivered{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe<TransferEvent>([this](const TransferEvent& e) {
            on_transfer_event(e);
        }));

        subscriptions_.push_back(bus.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
            stats_.transfers_started++;
        }));

        subscriptions_.push_back(bus.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            stats_.transfers_completed++;
            stats_.bytes_delivered += e.bytes;
        }));

        subscriptions_.push_back(bus.subscribe<TransferAbandonedEvent>([this](const TransferAbandonedEvent& e) {
            stats_.transfers_abandoned++;
            stats_.bytes_delivered += e.bytes;
        }));
    }

    ~MetricsComponent() {
        for (auto& subscription : subscriptions_) {
            subscription.unsubscribe();
        }
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const { return stats_; }

private:
    void on_transfer_event(const TransferEvent& e) {
        switch (e.kind) {
            case TransferEventKind::Registered:
                stats_.sources_registered++;
                break;
            case TransferEventKind::ChunkRead:
                stats_.chunks_read++;
                break;
            case TransferEventKind::ChunkAcknowledged:
                stats_.chunks_acknowledged++;
                break;
        }
    }

    Stats stats_;
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Keeps the most recent TransferEvents, oldest first
 */
class EventHistory {
public:
    EventHistory(EventBus& bus, std::size_t capacity) : capacity_(capacity) {
        subscription_ = bus.subscribe<TransferEvent>([this](const TransferEvent& e) {
            record(e);
        });
    }

    ~EventHistory() { subscription_.unsubscribe(); }

    EventHistory(const EventHistory&) = delete;
    EventHistory& operator=(const EventHistory&) = delete;

    std::vector<TransferEvent> recent() const {
        std::lock_guard lock(mutex_);
        return {events_.begin(), events_.end()};
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    void record(const TransferEvent& e) {
        std::lock_guard lock(mutex_);
        if (capacity_ == 0) {
            return;
        }
        events_.push_back(e);
        while (events_.size() > capacity_) {
            events_.pop_front();
        }
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<TransferEvent> events_;
    Subscription subscription_;
};

} // namespace chunkgate::events
