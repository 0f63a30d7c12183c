// event_bus.cpp
#include "event_bus.h"

#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace {

class DepthScope {
public:
    explicit DepthScope(int& depth) : depth(depth) { ++depth; }
    ~DepthScope() { --depth; }

private:
    int& depth;
};

}  // namespace

EventBus::EventBus(int max_depth) : max_depth(max_depth) {
    if (max_depth <= 0) {
        throw std::invalid_argument(std::format("Event bus max depth must be positive, got {}", max_depth));
    }
}

SubscriptionId EventBus::addHandler(std::type_index type, const char* name, std::function<void(GameEvent&)> handler) {
    spdlog::debug("Subscription {} to {}", next_id, name);
    SubscriptionId id = next_id++;
    subscribers[type].push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    for (auto& [type, list] : subscribers) {
        auto it = std::find_if(list.begin(), list.end(), [id](const Subscription& s) { return s.id == id; });
        if (it != list.end()) {
            list.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::dispatch(std::type_index type, const char* name, GameEvent& event) {
    if (current_depth >= max_depth) {
        throw EventRecursionError(
            std::format("Publishing {} exceeded the maximum event depth of {}", name, max_depth));
    }
    auto it = subscribers.find(type);
    if (it == subscribers.end()) {
        return;
    }

    DepthScope scope(current_depth);
    // Handlers may subscribe or unsubscribe while we iterate.
    std::vector<Subscription> snapshot = it->second;
    for (const Subscription& subscription : snapshot) {
        if (!isSubscribed(type, subscription.id)) {
            continue;
        }
        subscription.handler(event);
    }
}

bool EventBus::isSubscribed(std::type_index type, SubscriptionId id) const {
    auto it = subscribers.find(type);
    if (it == subscribers.end()) {
        return false;
    }
    return std::any_of(it->second.begin(), it->second.end(), [id](const Subscription& s) { return s.id == id; });
}

size_t EventBus::subscriberCount() const {
    size_t total = 0;
    for (const auto& [type, list] : subscribers) {
        total += list.size();
    }
    return total;
}

int EventBus::depth() const {
    return current_depth;
}

int EventBus::maxDepth() const {
    return max_depth;
}
