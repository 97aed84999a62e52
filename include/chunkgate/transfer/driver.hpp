#pragma once

/**
 * @file driver.hpp
 * @brief Pulls registered sources through a sink, one chunk at a time
 *
 * HOW IT INTEGRATES:
 * - Subscribes to TransferEvent on the store; every Registered event
 *   schedules run(key) on the driver's worker pool
 * - run() opens a sink, loops read -> write -> acknowledge, and closes the
 *   sink on every exit path
 * - Emits TransferStartedEvent, then TransferCompletedEvent or
 *   TransferAbandonedEvent on the bus
 *
 * There is never more than one chunk in flight per source. The
 * acknowledgement is what lets the next read happen.
 *
 * Registrations must not race the driver's destructor: a registration
 * already being delivered on another thread may still reach the driver
 * after it is gone. Call stop() first when other threads keep registering.
 */

#include "chunkgate/events/event_bus.hpp"
#include "chunkgate/transfer/chunk_sink.hpp"
#include "chunkgate/transfer/store.hpp"
#include "chunkgate/transfer/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <vector>

namespace chunkgate::transfer {

struct DriverOptions {
    std::size_t max_failures = 3;   ///< Consecutive failures before abandoning
    std::size_t worker_threads = 2;
};

class TransferDriver {
public:
    TransferDriver(TransferStore& store,
                   events::EventBus& bus,
                   ChunkSinkFactory sink_factory,
                   DriverOptions options = {});

    /// Stops reacting to registrations and waits for running transfers.
    ~TransferDriver();

    /// No new transfers are scheduled after this; running ones finish.
    void stop();

    TransferDriver(const TransferDriver&) = delete;
    TransferDriver& operator=(const TransferDriver&) = delete;

    /**
     * Drives one source to exhaustion or abandonment in the calling thread.
     * Any failed step (read, write, acknowledge) counts against the budget
     * and the same window is retried; a clean iteration resets the count.
     */
    TransferReport run(const SourceKey& key);

    /// Blocks until every scheduled transfer has finished.
    void wait_idle();

    /// Reports of transfers run from the pool, in completion order.
    std::vector<TransferReport> reports() const;

private:
    void schedule(const SourceKey& key);

    TransferStore& store_;
    events::EventBus& bus_;
    ChunkSinkFactory sink_factory_;
    DriverOptions options_;

    boost::asio::thread_pool pool_;
    events::Subscription subscription_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::size_t in_flight_ = 0;
    bool stopping_ = false;
    std::vector<TransferReport> reports_;
};

} // namespace chunkgate::transfer
