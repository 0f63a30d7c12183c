// ability.cpp
#include "ability.h"

#include "rules/player.h"

#include <format>
#include <stdexcept>
#include <spdlog/spdlog.h>

Ability::~Ability() {
    detach();
}

bool Ability::isActive(const Game&, const Player& owner) const {
    return owner.alive;
}

void Ability::attach(Game* game, Player* owner, EventBus* bus) {
    if (game == nullptr || owner == nullptr) {
        throw std::invalid_argument(std::format("Ability {} needs a game and an owner to attach", id()));
    }
    if (attached()) {
        throw std::logic_error(std::format("Ability {} is already attached to {}", id(), attached_owner->toString()));
    }
    attached_game = game;
    attached_owner = owner;
    event_bus = bus;
    if (event_bus) {
        subscribe(*event_bus);
    }
    spdlog::debug("Ability {} attached to {}", id(), owner->toString());
}

void Ability::detach() {
    if (event_bus) {
        for (SubscriptionId subscription : subscriptions) {
            event_bus->unsubscribe(subscription);
        }
    }
    subscriptions.clear();
    event_bus = nullptr;
    attached_game = nullptr;
    attached_owner = nullptr;
}

bool Ability::attached() const {
    return attached_owner != nullptr;
}

size_t Ability::subscriptionCount() const {
    return subscriptions.size();
}

Player* Ability::owner() const {
    return attached_owner;
}

Game* Ability::game() const {
    return attached_game;
}

void Ability::skippedReentry(const char* event_name) const {
    spdlog::warn("Ability {} skipped re-entrant {}", id(), event_name);
}
