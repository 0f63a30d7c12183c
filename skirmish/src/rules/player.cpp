// player.cpp
#include "player.h"

#include <algorithm>
#include <format>
#include <stdexcept>

Player::Player(int seat, const PlayerConfig& config)
    : seat(seat),
      name(config.name),
      hero(config.hero),
      faction(config.faction),
      max_health(config.max_health),
      health(config.max_health),
      is_lord(config.is_lord),
      hand(ZoneKind::HAND, this),
      equipment(ZoneKind::EQUIPMENT, this),
      judgement(ZoneKind::JUDGEMENT, this) {
    if (seat < 0) {
        throw std::invalid_argument(std::format("Player {} has negative seat {}", config.name, seat));
    }
    if (config.max_health <= 0) {
        throw std::invalid_argument(std::format("Player {} needs positive max health", config.name));
    }
}

int Player::takeDamage(int amount) {
    health = std::max(0, health - amount);
    return health;
}

int Player::heal(int amount) {
    health = std::min(max_health, health + amount);
    return health;
}

bool Player::isWounded() const {
    return health < max_health;
}

Card* Player::equipped(CardSubType slot) const {
    for (Card* card : equipment.cards) {
        if (card->subtype == slot) {
            return card;
        }
    }
    return nullptr;
}

int Player::usesThisTurn(CardSubType subtype) const {
    auto it = uses_this_turn.find(subtype);
    return it == uses_this_turn.end() ? 0 : it->second;
}

void Player::recordUse(CardSubType subtype) {
    uses_this_turn[subtype] += 1;
}

void Player::resetTurnUsage() {
    uses_this_turn.clear();
}

std::string Player::toString() const {
    return name + " (Seat " + std::to_string(seat) + " - Health: " + std::to_string(health) + "/" +
           std::to_string(max_health) + ")";
}
