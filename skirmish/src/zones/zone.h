#pragma once

#include <vector>
#include <string>
#include <cstddef>

// Forward Declarations
class Card;
class Player;

enum class ZoneKind {
    DRAW_PILE,
    DISCARD_PILE,
    HAND,
    EQUIPMENT,
    JUDGEMENT
};

std::string toString(ZoneKind kind);

// Ordered card container. Index 0 is the top of the zone.
class Zone {
public:
    ZoneKind kind;
    Player* owner;
    std::vector<Card*> cards;

    Zone(ZoneKind kind, Player* owner = nullptr);

    void insert(Card* card, size_t index);
    void add(Card* card);
    void remove(Card* card);

    bool contains(const Card* card) const;
    Card* findById(int card_id) const;
    Card* top() const;
    size_t size() const;
    bool empty() const;

    std::string id() const;
};
