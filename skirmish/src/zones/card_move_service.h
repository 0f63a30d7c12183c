#pragma once

#include <string>
#include <vector>

class Card;
class Game;
class Player;
class Zone;
class EventBus;

enum class MoveOrdering {
    TO_TOP,
    TO_BOTTOM,
    PRESERVE_ORDER
};

struct CardMoveDescriptor {
    Zone* source = nullptr;
    Zone* target = nullptr;
    std::vector<Card*> cards;
    MoveOrdering ordering = MoveOrdering::PRESERVE_ORDER;
    std::string reason;
};

struct CardMoveResult {
    std::vector<Card*> moved;
};

class CardMoveService {
public:
    virtual ~CardMoveService() = default;

    // Violations (null or duplicate card, card missing from source, card already in target)
    // throw and leave both zones untouched.
    virtual CardMoveResult moveCards(const CardMoveDescriptor& descriptor) = 0;
    virtual std::vector<Card*> drawCards(Player& player, int count) = 0;
    virtual CardMoveResult discardFromHand(Player& player, const std::vector<Card*>& cards) = 0;

    CardMoveResult moveCard(Card* card, Zone* source, Zone* target, MoveOrdering ordering, const std::string& reason);
};

class BasicCardMoveService : public CardMoveService {
public:
    BasicCardMoveService(Game* game, EventBus* event_bus = nullptr);

    CardMoveResult moveCards(const CardMoveDescriptor& descriptor) override;
    std::vector<Card*> drawCards(Player& player, int count) override;
    CardMoveResult discardFromHand(Player& player, const std::vector<Card*>& cards) override;

private:
    Game* game;
    EventBus* event_bus;

    void validate(const CardMoveDescriptor& descriptor) const;
};
