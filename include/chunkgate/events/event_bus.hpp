/**
 * @file event_bus.hpp
 * @brief Type-safe event bus carrying transfer notifications
 *
 * WHY THIS FILE EXISTS:
 * The transfer store publishes what happened to a window (registered,
 * chunk read, chunk acknowledged) without knowing who listens. Drivers,
 * loggers, metrics and the status history subscribe without knowing who
 * emits.
 *
 * WHAT IT DOES:
 * - Type-safe event subscription and emission
 * - Thread-safe concurrent access
 * - Subscription handles that remove their handler
 * - Snapshot delivery: handlers registered or removed during an emit
 *   do not change the pass already in progress
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe<TransferEvent>([](const TransferEvent& e) { ... });
 * bus.emit(TransferEvent{key, TransferEventKind::Registered});
 * sub.unsubscribe();
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chunkgate::events {

/**
 * @brief Handle returned by EventBus::subscribe
 *
 * Calling unsubscribe() removes the handler from the bus. It is safe to
 * call more than once and from inside the handler itself. The handle does
 * not unsubscribe on destruction; owners that outlive their interest call
 * unsubscribe() explicitly. The bus must outlive every handle that is
 * still going to be used.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> remover)
        : remover_(std::move(remover)) {}

    Subscription(Subscription&& other) noexcept
        : remover_(std::exchange(other.remover_, nullptr)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        remover_ = std::exchange(other.remover_, nullptr);
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void unsubscribe() {
        if (auto remover = std::exchange(remover_, nullptr)) {
            remover();
        }
    }

    [[nodiscard]] bool active() const noexcept { return static_cast<bool>(remover_); }

private:
    std::function<void()> remover_;
};

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Multiple threads can emit events concurrently
 * - Multiple threads can subscribe and unsubscribe concurrently
 * - Handlers are called synchronously in the emitting thread, in
 *   subscription order, without any bus lock held
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    // Non-copyable, non-movable: subscriptions point back at this bus
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * PARAMETERS:
     * handler - Function called when event is emitted
     *           Signature: void(const EventType&)
     *
     * RETURNS:
     * Subscription handle; call unsubscribe() on it to stop deliveries
     *
     * EXAMPLE:
     * auto sub = bus.subscribe<TransferEvent>([](const TransferEvent& e) {
     *     spdlog::info("event for {}", e.key);
     * });
     */
    template<typename EventType>
    Subscription subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;

        handlers_[type_id].push_back({handler_id, wrapper});

        return Subscription([this, handler_id]() {
            unsubscribe<EventType>(handler_id);
        });
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * HOW IT WORKS:
     * 1. Copy the handler list for this event type under a shared lock
     * 2. Release the lock
     * 3. Call each handler from the copy
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged; remaining handlers still execute.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto type_id = std::type_index(typeid(EventType));
            auto it = handlers_.find(type_id);

            if (it == handlers_.end()) {
                return;
            }

            handlers_copy.reserve(it->second.size());
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    /**
     * @brief Get number of subscribers for an event type
     */
    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /**
     * @brief Remove all subscribers
     */
    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);

        if (it != handlers_.end()) {
            auto& handler_list = it->second;
            handler_list.erase(
                std::remove_if(handler_list.begin(), handler_list.end(),
                    [handler_id](const auto& pair) {
                        return pair.first == handler_id;
                    }),
                handler_list.end()
            );
        }
    }

    // ════════════════════════════════════════════════════════
    // Type Erasure Implementation
    // ════════════════════════════════════════════════════════

    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            // Only EventType* is ever stored under this type index
            const EventType* typed_event = static_cast<const EventType*>(event);
            func(*typed_event);
        }
    };

    // Map: event type -> list of (handler_id, handler), in subscription order
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;

    size_t next_handler_id_ = 0;
};

} // namespace chunkgate::events
