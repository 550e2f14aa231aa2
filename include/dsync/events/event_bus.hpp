/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe hub for sync progress
 *
 * WHY THIS FILE EXISTS:
 * Transfer workers report progress from several threads at once. The bus
 * lets them publish without knowing whether a logger, a metrics counter or
 * the CLI progress line is listening.
 *
 * WHAT IT DOES:
 * - Subscription per event type, keyed by std::type_index
 * - Concurrent emit from worker threads (shared lock)
 * - Handlers run synchronously on the emitting thread
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<FileSkippedEvent>([](const FileSkippedEvent& e) { ... });
 * bus.emit(FileSkippedEvent{"photos", "a/b.png", "up to date"});
 * bus.unsubscribe<FileSkippedEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dsync::events {

using SubscriptionId = std::size_t;

/**
 * @brief Type-erased event bus
 *
 * THREAD SAFETY:
 * - emit() may be called concurrently from any number of workers
 * - subscribe()/unsubscribe() take the exclusive lock
 * - Handlers are copied out before being called, so a handler may
 *   subscribe or unsubscribe without deadlocking
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(
            id, std::make_shared<TypedHandler<EventType>>(std::move(handler)));
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the emitting worker is not interrupted.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& entry : it->second) {
                targets.push_back(entry.second);
            }
        }

        for (const auto& handler : targets) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct TypedHandler : HandlerBase {
        explicit TypedHandler(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }

        std::function<void(const EventType&)> func;
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<SubscriptionId, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace dsync::events
