#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>

class Zone;
class Player;

enum class Suit {
    SPADE,
    HEART,
    CLUB,
    DIAMOND
};

enum class CardType {
    BASIC,
    TRICK,
    EQUIPMENT
};

enum class CardSubType {
    ATTACK,
    EVADE,
    PEACH,
    ARROW_VOLLEY,
    WEAPON,
    ARMOR,
    OFFENSIVE_HORSE,
    DEFENSIVE_HORSE
};

std::string toString(Suit suit);
std::string toString(CardSubType subtype);

bool isEquipment(CardSubType subtype);

class Card {
public:
    static int next_id;
    int id;

    std::string name;
    Suit suit;
    int rank;
    CardType type;
    CardSubType subtype;
    // Ability granted while the card sits in an equipment zone.
    std::optional<std::string> granted_ability;

    Player* owner;
    Zone* current_zone;

    bool isRed() const;
    bool isBlack() const;
    std::string toString() const;

    Card(const std::string& name,
         Suit suit,
         int rank,
         CardType type,
         CardSubType subtype,
         std::optional<std::string> granted_ability = std::nullopt);

    Card(const Card& other);
};

using Deck = std::vector<std::unique_ptr<Card>>;
