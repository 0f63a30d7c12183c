// hero_abilities.cpp
#include "hero_abilities.h"

#include "judgement/judgement_service.h"
#include "resolution/damage_resolvers.h"
#include "resolution/resolution_context.h"
#include "resolution/resolution_stack.h"
#include "rules/game.h"
#include "zones/card_move_service.h"

#include <algorithm>
#include <climits>
#include <format>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

RuleHookSet YingziAbility::ruleHooks() const {
    return ::ruleHooks({RuleQuery::DRAW_COUNT});
}

std::optional<int> YingziAbility::modifyDrawCount(int, const Game&, const Player& drawer) const {
    if (&drawer != owner()) {
        return std::nullopt;
    }
    return 1;
}

RuleHookSet RoarAbility::ruleHooks() const {
    return ::ruleHooks({RuleQuery::MAX_USES_PER_TURN});
}

std::optional<int> RoarAbility::modifyMaxUsesPerTurn(int, const Game&, const Player& user, CardSubType subtype) const {
    if (&user != owner() || subtype != CardSubType::ATTACK) {
        return std::nullopt;
    }
    return INT_MAX;
}

RuleHookSet WushuangAbility::ruleHooks() const {
    return ::ruleHooks({RuleQuery::REQUIRED_RESPONSE_COUNT});
}

std::optional<int> WushuangAbility::modifyRequiredResponseCount(int current,
                                                                const Game&,
                                                                const Player& source,
                                                                const Player&,
                                                                ResponseType type) const {
    if (&source != owner() || type != ResponseType::ATTACK_EVADE) {
        return std::nullopt;
    }
    return std::max(current, 2);
}

RuleHookSet LongdanAbility::ruleHooks() const {
    return ::ruleHooks({RuleQuery::CAN_RESPOND});
}

std::optional<RuleResult> LongdanAbility::modifyCanRespond(const RuleResult& current,
                                                           const ResponseContext& context,
                                                           const Card& card) const {
    if (context.responder != owner() || card.subtype != CardSubType::ATTACK) {
        return std::nullopt;
    }
    if (expectedResponseCard(context.response_type) != CardSubType::EVADE) {
        return std::nullopt;
    }
    // Other refusals, such as a dead owner or a card outside the hand, stand.
    if (current.allowed || current.reason != RuleReason::RESPONSE_NOT_ALLOWED) {
        return std::nullopt;
    }
    return RuleResult::allow();
}

RuleHookSet HorsemanshipAbility::ruleHooks() const {
    return ::ruleHooks({RuleQuery::SEAT_DISTANCE});
}

std::optional<int> HorsemanshipAbility::modifySeatDistance(int, const Game&, const Player& from, const Player&) const {
    if (&from != owner()) {
        return std::nullopt;
    }
    return -1;
}

void JianxiongAbility::subscribe(EventBus& event_bus) {
    listen<DamageResolvedEvent>(event_bus, [this](DamageResolvedEvent& event) { onDamageResolved(event); });
}

void JianxiongAbility::onDamageResolved(DamageResolvedEvent& event) {
    Player* self = owner();
    ResolutionContext* context = event.context;
    if (context == nullptr || self == nullptr || event.target_seat != self->seat || !event.damage.causing_card_id) {
        return;
    }
    Card* card = context->game->card(*event.damage.causing_card_id);
    if (card == nullptr || !context->game->discard_pile.contains(card)) {
        return;
    }
    if (!context->canAskPlayers() || !context->confirm(self->seat, "ability.jianxiong")) {
        return;
    }
    context->card_moves->moveCard(card, &context->game->discard_pile, &self->hand, MoveOrdering::TO_BOTTOM, id());
    context->log("AbilityActivated", std::format("{} takes {} with jianxiong", self->toString(), card->toString()));
}

void GanglieAbility::subscribe(EventBus& event_bus) {
    listen<DamageResolvedEvent>(event_bus, [this](DamageResolvedEvent& event) { onDamageResolved(event); });
}

void GanglieAbility::onDamageResolved(DamageResolvedEvent& event) {
    Player* self = owner();
    ResolutionContext* context = event.context;
    if (context == nullptr || self == nullptr || event.target_seat != self->seat || !event.damage.source_seat) {
        return;
    }
    Player* source = context->game->player(*event.damage.source_seat);
    if (source == nullptr || source == self || !source->alive || context->judgement == nullptr) {
        return;
    }
    if (!context->canAskPlayers() || !context->confirm(self->seat, "ability.ganglie")) {
        return;
    }
    context->stack->push(std::make_unique<GanglieResolver>(self->seat, source->seat), *context);
}

GanglieResolver::GanglieResolver(int owner_seat, int source_seat) : owner_seat(owner_seat), source_seat(source_seat) {}

ResolutionResult GanglieResolver::resolve(ResolutionContext& context) {
    Player* self = context.game->player(owner_seat);
    Player* source = context.game->player(source_seat);
    if (self == nullptr || source == nullptr) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_TARGET, "ability.ganglie.unknownPlayer");
    }
    if (!source->alive) {
        return ResolutionResult::failure(ResolutionErrorCode::TARGET_NOT_ALIVE, "ability.ganglie.sourceDead");
    }
    if (context.judgement == nullptr) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "ability.ganglie.noJudgement");
    }

    JudgementResult judgement =
        context.judgement->judge(*context.game, *self, JudgementRequest{"ganglie", judgement_rules::isNotHeart()});
    if (!judgement.success) {
        context.log("AbilityFizzled", std::format("ganglie judgement for {} fails", self->toString()));
        return ResolutionResult::ok();
    }
    if (sourceDiscards(context, *source)) {
        return ResolutionResult::ok();
    }

    DamageDescriptor damage;
    damage.source_seat = self->seat;
    damage.target_seat = source->seat;
    damage.amount = 1;
    damage.reason = "ganglie";
    context.stack->push(std::make_unique<DamageResolver>(), context.withDamage(damage));
    return ResolutionResult::ok();
}

bool GanglieResolver::sourceDiscards(ResolutionContext& context, Player& source) {
    if (source.hand.size() < 2 || !context.canAskPlayers()) {
        return false;
    }
    ChoiceRequest request(source.seat, ChoiceType::SELECT_CARDS, true, "ability.ganglie.discard");
    for (const Card* card : source.hand.cards) {
        request.allowed_card_ids.push_back(card->id);
    }
    ChoiceResult choice = context.ask(request);
    if (choice.selected_card_ids.size() != 2) {
        return false;
    }

    std::vector<Card*> cards;
    for (int card_id : choice.selected_card_ids) {
        cards.push_back(source.hand.findById(card_id));
    }
    try {
        context.card_moves->discardFromHand(source, cards);
    } catch (const std::logic_error& e) {
        spdlog::warn("{} could not pay the ganglie discard: {}", source.toString(), e.what());
        return false;
    }
    context.log("AbilityCostPaid", std::format("{} discards two cards to ganglie", source.toString()));
    return true;
}

bool HujiaAbility::canProvideAssistance(const Game&, const Player& owner, ResponseType type) const {
    return owner.is_lord && type == ResponseType::ATTACK_EVADE;
}

std::vector<Player*> HujiaAbility::assistants(const Game& game, const Player& owner) const {
    std::vector<Player*> helpers;
    for (Player* player : game.seatOrderAfter(owner.seat)) {
        if (player->faction == kFaction) {
            helpers.push_back(player);
        }
    }
    return helpers;
}
