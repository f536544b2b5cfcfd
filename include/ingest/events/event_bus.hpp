/**
 * @file event_bus.hpp
 * @brief Type-indexed publish/subscribe for upload lifecycle events
 *
 * The coordinator and progress reporters emit events without knowing who
 * listens; the logger and any caller-side UI subscribe without knowing
 * who emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<PartUploadedEvent>([](const PartUploadedEvent& e) { ... });
 * bus.emit(PartUploadedEvent{...});
 * bus.unsubscribe(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace ingest::events {

/// Unique across all event types of one bus.
using SubscriptionId = std::size_t;

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - emit() may be called from several dispatcher workers at once
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may subscribe or unsubscribe
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<const ErasedHandler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        routes_[std::type_index(typeid(EventType))].push_back(Subscription{id, std::move(erased)});
        return id;
    }

    /// Unknown or already removed ids are ignored.
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        for (auto& [type, subscriptions] : routes_) {
            auto it = std::find_if(subscriptions.begin(), subscriptions.end(),
                                   [id](const Subscription& s) { return s.id == id; });
            if (it != subscriptions.end()) {
                subscriptions.erase(it);
                return;
            }
        }
    }

    /**
     * @brief Deliver @p event to every subscriber of its type
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the emitter never sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<const ErasedHandler>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = routes_.find(std::type_index(typeid(EventType)));
            if (it == routes_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& subscription : it->second) {
                targets.push_back(subscription.handler);
            }
        }

        for (const auto& target : targets) {
            try {
                (*target)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = routes_.find(std::type_index(typeid(EventType)));
        return it == routes_.end() ? 0 : it->second.size();
    }

private:
    // Receives a pointer to the event type it was registered under
    using ErasedHandler = std::function<void(const void*)>;

    struct Subscription {
        SubscriptionId id;
        std::shared_ptr<const ErasedHandler> handler;
    };

    std::unordered_map<std::type_index, std::vector<Subscription>> routes_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace ingest::events
