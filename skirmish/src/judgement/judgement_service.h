#pragma once

#include <functional>
#include <string>

class Card;
class Game;
class Player;
class CardMoveService;
class EventBus;

struct JudgementRequest {
    std::string reason;
    std::function<bool(const Card&)> rule;
};

struct JudgementResult {
    Card* card = nullptr;
    bool success = false;
};

namespace judgement_rules {

std::function<bool(const Card&)> isRed();
std::function<bool(const Card&)> isNotHeart();

}  // namespace judgement_rules

// Flips the top card of the draw pile into the owner's judgement zone and tests it.
class JudgementService {
public:
    virtual ~JudgementService() = default;
    virtual JudgementResult executeJudgement(Game& game, Player& owner, const JudgementRequest& request) = 0;
    // Sends the judgement card to the discard pile.
    virtual void completeJudgement(Game& game, Player& owner, Card* card) = 0;

    JudgementResult judge(Game& game, Player& owner, const JudgementRequest& request);
};

class BasicJudgementService : public JudgementService {
public:
    BasicJudgementService(CardMoveService* card_moves, EventBus* event_bus = nullptr);

    JudgementResult executeJudgement(Game& game, Player& owner, const JudgementRequest& request) override;
    void completeJudgement(Game& game, Player& owner, Card* card) override;

private:
    CardMoveService* card_moves;
    EventBus* event_bus;
};
