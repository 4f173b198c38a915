/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for decoupled component communication
 *
 * The upload service emits lifecycle events without knowing who listens;
 * logging and metrics subscribe without knowing who emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<SessionCreatedEvent>([](const SessionCreatedEvent& e) { ... });
 * bus.emit(SessionCreatedEvent{id, target});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bitsd::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - emit() may be called concurrently from every request thread
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may itself subscribe or emit
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register @p handler for events of type EventType
     *
     * RETURNS:
     * Subscription ID for unsubscribe()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const size_t handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back(
            {handler_id, std::make_shared<HandlerImpl<EventType>>(std::move(handler))});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& entry) { return entry.first == handler_id; }),
                   list.end());
    }

    /**
     * @brief Deliver @p event to every subscriber of its type
     *
     * A throwing handler is logged and skipped; the remaining handlers
     * still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
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

        for (auto& handler : targets) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
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
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace bitsd::events
