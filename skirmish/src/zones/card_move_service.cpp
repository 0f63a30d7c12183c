// card_move_service.cpp
#include "card_move_service.h"

#include "events/event_bus.h"
#include "rules/game.h"

#include <algorithm>
#include <format>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

CardMoveResult CardMoveService::moveCard(Card* card,
                                         Zone* source,
                                         Zone* target,
                                         MoveOrdering ordering,
                                         const std::string& reason) {
    return moveCards(CardMoveDescriptor{source, target, {card}, ordering, reason});
}

BasicCardMoveService::BasicCardMoveService(Game* game, EventBus* event_bus) : game(game), event_bus(event_bus) {
    if (game == nullptr) {
        throw std::invalid_argument("BasicCardMoveService needs a game");
    }
}

void BasicCardMoveService::validate(const CardMoveDescriptor& descriptor) const {
    if (descriptor.source == nullptr || descriptor.target == nullptr) {
        throw std::invalid_argument("Card move needs a source and a target zone");
    }
    if (descriptor.source == descriptor.target) {
        throw std::invalid_argument(std::format("Card move source and target are both {}", descriptor.source->id()));
    }
    std::set<int> seen;
    for (const Card* card : descriptor.cards) {
        if (card == nullptr) {
            throw std::invalid_argument("Card move contains a null card");
        }
        if (!seen.insert(card->id).second) {
            throw std::invalid_argument(std::format("Card {} appears twice in one move", card->toString()));
        }
        if (!descriptor.source->contains(card)) {
            throw std::logic_error(
                std::format("Card {} is not in source zone {}", card->toString(), descriptor.source->id()));
        }
        if (descriptor.target->contains(card)) {
            throw std::logic_error(
                std::format("Card {} is already in target zone {}", card->toString(), descriptor.target->id()));
        }
    }
}

CardMoveResult BasicCardMoveService::moveCards(const CardMoveDescriptor& descriptor) {
    validate(descriptor);
    CardMoveResult result;
    if (descriptor.cards.empty()) {
        return result;
    }

    std::vector<int> ids;
    for (const Card* card : descriptor.cards) {
        ids.push_back(card->id);
    }

    if (event_bus) {
        CardMovedEvent before;
        before.game = game;
        before.timing = MoveTiming::BEFORE;
        before.card_ids = ids;
        before.source = descriptor.source;
        before.target = descriptor.target;
        before.reason = descriptor.reason;
        event_bus->publish(before);
    }

    size_t index = 0;
    for (Card* card : descriptor.cards) {
        descriptor.source->remove(card);
        if (descriptor.ordering == MoveOrdering::TO_TOP) {
            descriptor.target->insert(card, index++);
        } else {
            descriptor.target->add(card);
        }
        card->owner = descriptor.target->owner;
        result.moved.push_back(card);
    }

    spdlog::debug("Moved {} card(s) from {} to {} ({})", result.moved.size(), descriptor.source->id(),
                  descriptor.target->id(), descriptor.reason);

    if (event_bus) {
        CardMovedEvent after;
        after.game = game;
        after.timing = MoveTiming::AFTER;
        after.card_ids = ids;
        after.source = descriptor.source;
        after.target = descriptor.target;
        after.reason = descriptor.reason;
        event_bus->publish(after);
    }
    return result;
}

std::vector<Card*> BasicCardMoveService::drawCards(Player& player, int count) {
    if (count < 0) {
        throw std::invalid_argument(std::format("Cannot draw {} cards", count));
    }
    if (static_cast<int>(game->draw_pile.size()) < count) {
        throw std::runtime_error(
            std::format("Draw pile has {} cards, {} requested by {}", game->draw_pile.size(), count, player.toString()));
    }
    std::vector<Card*> drawn(game->draw_pile.cards.begin(), game->draw_pile.cards.begin() + count);
    moveCards(CardMoveDescriptor{&game->draw_pile, &player.hand, drawn, MoveOrdering::TO_BOTTOM, "draw"});
    return drawn;
}

CardMoveResult BasicCardMoveService::discardFromHand(Player& player, const std::vector<Card*>& cards) {
    return moveCards(CardMoveDescriptor{&player.hand, &game->discard_pile, cards, MoveOrdering::TO_TOP, "discard"});
}
