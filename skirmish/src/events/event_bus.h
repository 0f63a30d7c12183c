#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <vector>

#include "events/events.h"

using SubscriptionId = std::uint64_t;

class EventRecursionError : public std::runtime_error {
public:
    explicit EventRecursionError(const std::string& message) : std::runtime_error(message) {}
};

// Synchronous, re-entrant publish/subscribe keyed by event type.
// Nested publishes deeper than max_depth throw EventRecursionError.
class EventBus {
public:
    static constexpr int kDefaultMaxDepth = 32;

    explicit EventBus(int max_depth = kDefaultMaxDepth);

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template <typename T>
    SubscriptionId subscribe(std::function<void(T&)> handler) {
        static_assert(std::is_base_of_v<GameEvent, T>, "events must derive from GameEvent");
        if (!handler) {
            throw std::invalid_argument(std::string("Cannot subscribe an empty handler to ") + typeid(T).name());
        }
        return addHandler(std::type_index(typeid(T)), typeid(T).name(),
                          [handler = std::move(handler)](GameEvent& event) { handler(static_cast<T&>(event)); });
    }

    // Unknown or already removed ids are ignored.
    bool unsubscribe(SubscriptionId id);

    template <typename T>
    void publish(T& event) {
        static_assert(std::is_base_of_v<GameEvent, T>, "events must derive from GameEvent");
        dispatch(std::type_index(typeid(T)), typeid(T).name(), event);
    }

    template <typename T>
    size_t subscriberCount() const {
        auto it = subscribers.find(std::type_index(typeid(T)));
        return it == subscribers.end() ? 0 : it->second.size();
    }

    size_t subscriberCount() const;
    int depth() const;
    int maxDepth() const;

private:
    struct Subscription {
        SubscriptionId id;
        std::function<void(GameEvent&)> handler;
    };

    std::map<std::type_index, std::vector<Subscription>> subscribers;
    SubscriptionId next_id = 1;
    int current_depth = 0;
    int max_depth;

    SubscriptionId addHandler(std::type_index type, const char* name, std::function<void(GameEvent&)> handler);
    void dispatch(std::type_index type, const char* name, GameEvent& event);
    bool isSubscribed(std::type_index type, SubscriptionId id) const;
};
