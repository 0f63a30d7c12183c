// standard_cards.cpp
#include "standard_cards.h"

#include "cardsets/card_registry.h"

#include <stdexcept>

Card basicCard(const std::string& name, Suit suit, int rank, CardSubType subtype) {
    return Card(name, suit, rank, CardType::BASIC, subtype);
}

Card trickCard(const std::string& name, Suit suit, int rank, CardSubType subtype) {
    return Card(name, suit, rank, CardType::TRICK, subtype);
}

Card equipmentCard(const std::string& name, Suit suit, int rank, CardSubType slot, const std::string& ability_id) {
    if (!isEquipment(slot)) {
        throw std::invalid_argument("Equipment card needs an equipment slot: " + name);
    }
    return Card(name, suit, rank, CardType::EQUIPMENT, slot, ability_id);
}

void registerStandardCards() {
    CardRegistry& registry = CardRegistry::instance();

    registry.registerCard("Attack", basicCard("Attack", Suit::SPADE, 7, CardSubType::ATTACK));
    registry.registerCard("Red Attack", basicCard("Red Attack", Suit::HEART, 10, CardSubType::ATTACK));
    registry.registerCard("Evade", basicCard("Evade", Suit::DIAMOND, 2, CardSubType::EVADE));
    registry.registerCard("Peach", basicCard("Peach", Suit::HEART, 3, CardSubType::PEACH));

    registry.registerCard("Arrow Volley", trickCard("Arrow Volley", Suit::HEART, 1, CardSubType::ARROW_VOLLEY));

    registry.registerCard("Zhuge Crossbow",
                          equipmentCard("Zhuge Crossbow", Suit::CLUB, 1, CardSubType::WEAPON, "zhuge_crossbow"));
    registry.registerCard("Qinglong Blade",
                          equipmentCard("Qinglong Blade", Suit::SPADE, 5, CardSubType::WEAPON, "qinglong_blade"));
    registry.registerCard("Kirin Bow",
                          equipmentCard("Kirin Bow", Suit::HEART, 5, CardSubType::WEAPON, "kirin_bow"));
    registry.registerCard("Renwang Shield",
                          equipmentCard("Renwang Shield", Suit::CLUB, 2, CardSubType::ARMOR, "renwang_shield"));
    registry.registerCard("Bagua Array",
                          equipmentCard("Bagua Array", Suit::SPADE, 2, CardSubType::ARMOR, "bagua_array"));
    registry.registerCard("Dilu",
                          equipmentCard("Dilu", Suit::CLUB, 5, CardSubType::DEFENSIVE_HORSE, "defensive_horse"));
    registry.registerCard("Chitu",
                          equipmentCard("Chitu", Suit::HEART, 5, CardSubType::OFFENSIVE_HORSE, "offensive_horse"));
}
