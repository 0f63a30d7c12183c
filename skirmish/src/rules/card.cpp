// card.cpp
#include "card.h"

#include <format>
#include <stdexcept>

std::string toString(Suit suit) {
    switch (suit) {
        case Suit::SPADE:
            return "Spade";
        case Suit::HEART:
            return "Heart";
        case Suit::CLUB:
            return "Club";
        case Suit::DIAMOND:
            return "Diamond";
    }
    throw std::invalid_argument("Unknown suit");
}

std::string toString(CardSubType subtype) {
    switch (subtype) {
        case CardSubType::ATTACK:
            return "Attack";
        case CardSubType::EVADE:
            return "Evade";
        case CardSubType::PEACH:
            return "Peach";
        case CardSubType::ARROW_VOLLEY:
            return "ArrowVolley";
        case CardSubType::WEAPON:
            return "Weapon";
        case CardSubType::ARMOR:
            return "Armor";
        case CardSubType::OFFENSIVE_HORSE:
            return "OffensiveHorse";
        case CardSubType::DEFENSIVE_HORSE:
            return "DefensiveHorse";
    }
    throw std::invalid_argument("Unknown card subtype");
}

bool isEquipment(CardSubType subtype) {
    return subtype == CardSubType::WEAPON ||
           subtype == CardSubType::ARMOR ||
           subtype == CardSubType::OFFENSIVE_HORSE ||
           subtype == CardSubType::DEFENSIVE_HORSE;
}

int Card::next_id = 0;

Card::Card(const std::string& name,
           Suit suit,
           int rank,
           CardType type,
           CardSubType subtype,
           std::optional<std::string> granted_ability)
    : id(next_id++),
      name(name),
      suit(suit),
      rank(rank),
      type(type),
      subtype(subtype),
      granted_ability(std::move(granted_ability)),
      owner(nullptr), // set when dealt to a player
      current_zone(nullptr) {
    if (rank < 1 || rank > 13) {
        throw std::invalid_argument(std::format("Card {} has invalid rank {}", name, rank));
    }
}

Card::Card(const Card& other)
    : id(next_id++),  // Assign a new unique ID
      name(other.name),
      suit(other.suit),
      rank(other.rank),
      type(other.type),
      subtype(other.subtype),
      granted_ability(other.granted_ability),
      owner(nullptr),
      current_zone(nullptr) {}

bool Card::isRed() const {
    return suit == Suit::HEART || suit == Suit::DIAMOND;
}

bool Card::isBlack() const {
    return !isRed();
}

std::string Card::toString() const {
    return std::format("{{id: {}, name: {}, suit: {}, rank: {}}}", id, name, ::toString(suit), rank);
}
