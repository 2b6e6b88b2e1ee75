/**
 * @file event_bus.hpp
 * @brief Type-safe event bus connecting the monitor, the session manager
 *        and their consumers
 *
 * WHAT IT DOES:
 * - Type-safe subscription and emission for any event struct
 * - Thread-safe concurrent subscribe/unsubscribe/emit
 * - Scoped subscriptions that unsubscribe when they go out of scope, so a
 *   replaced consumer never leaves a dangling handler behind
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe_scoped<DeviceConnectedEvent>(
 *     [](const DeviceConnectedEvent& e) { ... });
 * bus.emit(DeviceConnectedEvent{device});
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

namespace qadt::events {

class EventBus;

/**
 * @brief RAII handle for one handler registration
 *
 * Holds only a weak reference to the bus internals, so it may safely
 * outlive the bus.
 */
class Subscription {
public:
    Subscription() = default;
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : release_(std::move(other.release_)) {
        other.release_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            release_ = std::move(other.release_);
            other.release_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (release_) {
            auto release = std::move(release_);
            release_ = nullptr;
            release();
        }
    }

    [[nodiscard]] bool active() const noexcept { return static_cast<bool>(release_); }

private:
    friend class EventBus;
    explicit Subscription(std::function<void()> release) : release_(std::move(release)) {}

    std::function<void()> release_;
};

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Handlers are called synchronously on the emitting thread, without the
 *   bus lock held, so a handler may subscribe, unsubscribe or emit
 * - A handler that throws is logged; the remaining handlers still run
 */
class EventBus {
public:
    EventBus() : state_(std::make_shared<State>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(state_->mutex);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = state_->next_handler_id++;

        state_->handlers[type_id].push_back({handler_id, wrapper});
        return handler_id;
    }

    /**
     * @brief Subscribe and get a handle that unsubscribes on destruction
     */
    template<typename EventType>
    [[nodiscard]] Subscription subscribe_scoped(std::function<void(const EventType&)> handler) {
        size_t handler_id = subscribe<EventType>(std::move(handler));
        std::weak_ptr<State> weak = state_;
        return Subscription([weak, handler_id]() {
            if (auto state = weak.lock()) {
                remove_handler(*state, std::type_index(typeid(EventType)), handler_id);
            }
        });
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        remove_handler(*state_, std::type_index(typeid(EventType)), handler_id);
    }

    template<typename EventType>
    void emit(const EventType& event) {
        // Copy handler pointers so handlers run without the lock
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(state_->mutex);
            auto it = state_->handlers.find(std::type_index(typeid(EventType)));
            if (it == state_->handlers.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] Handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(state_->mutex);
        auto it = state_->handlers.find(std::type_index(typeid(EventType)));
        return it != state_->handlers.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(state_->mutex);
        state_->handlers.clear();
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

    struct State {
        std::unordered_map<
            std::type_index,
            std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
        > handlers;
        mutable std::shared_mutex mutex;
        size_t next_handler_id = 0;
    };

    static void remove_handler(State& state, std::type_index type_id, size_t handler_id) {
        std::unique_lock lock(state.mutex);
        auto it = state.handlers.find(type_id);
        if (it == state.handlers.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& pair) { return pair.first == handler_id; }),
            handler_list.end());
    }

    std::shared_ptr<State> state_;
};

} // namespace qadt::events
