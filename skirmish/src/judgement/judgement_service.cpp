// judgement_service.cpp
#include "judgement_service.h"

#include "events/event_bus.h"
#include "rules/game.h"
#include "zones/card_move_service.h"

#include <format>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace judgement_rules {

std::function<bool(const Card&)> isRed() {
    return [](const Card& card) { return card.isRed(); };
}

std::function<bool(const Card&)> isNotHeart() {
    return [](const Card& card) { return card.suit != Suit::HEART; };
}

}  // namespace judgement_rules

JudgementResult JudgementService::judge(Game& game, Player& owner, const JudgementRequest& request) {
    JudgementResult result = executeJudgement(game, owner, request);
    completeJudgement(game, owner, result.card);
    return result;
}

BasicJudgementService::BasicJudgementService(CardMoveService* card_moves, EventBus* event_bus)
    : card_moves(card_moves), event_bus(event_bus) {
    if (card_moves == nullptr) {
        throw std::invalid_argument("BasicJudgementService needs a card move service");
    }
}

JudgementResult BasicJudgementService::executeJudgement(Game& game, Player& owner, const JudgementRequest& request) {
    if (!request.rule) {
        throw std::invalid_argument(std::format("Judgement {} has no rule", request.reason));
    }
    Card* card = game.draw_pile.top();
    if (card == nullptr) {
        throw std::runtime_error(std::format("Draw pile is empty during judgement {}", request.reason));
    }
    card_moves->moveCard(card, &game.draw_pile, &owner.judgement, MoveOrdering::TO_TOP, "judgement");

    JudgementResult result{card, request.rule(*card)};
    spdlog::info("Judgement {} for {} reveals {}: {}", request.reason, owner.toString(), card->toString(),
                 result.success ? "success" : "failure");

    if (event_bus) {
        JudgementCompletedEvent event;
        event.game = &game;
        event.seat = owner.seat;
        event.card_id = card->id;
        event.reason = request.reason;
        event.success = result.success;
        event_bus->publish(event);
    }
    return result;
}

void BasicJudgementService::completeJudgement(Game& game, Player& owner, Card* card) {
    if (card == nullptr || !owner.judgement.contains(card)) {
        throw std::logic_error(std::format("No judgement card to complete for {}", owner.toString()));
    }
    card_moves->moveCard(card, &owner.judgement, &game.discard_pile, MoveOrdering::TO_TOP, "judgement.complete");
}
