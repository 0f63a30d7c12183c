// card_resolvers.cpp
#include "card_resolvers.h"

#include "resolution/damage_resolvers.h"
#include "resolution/resolution_context.h"
#include "resolution/resolution_stack.h"
#include "response/evade_providers.h"
#include "response/response_window.h"
#include "rules/game.h"
#include "rules/rule_service.h"
#include "zones/card_move_service.h"

#include <algorithm>
#include <format>
#include <memory>
#include <stdexcept>

namespace {

// Publishes a CardEffectCheckEvent and reports whether a handler vetoed the card.
bool vetoed(ResolutionContext& context, const Card* card, int source_seat, int target_seat) {
    CardEffectCheckEvent check;
    check.card = card;
    check.source_seat = source_seat;
    check.target_seat = target_seat;
    context.publish(check);
    if (check.vetoed) {
        context.log("CardEffectVetoed",
                    std::format("{} has no effect on seat {} ({})", card->toString(), target_seat, check.vetoed_by),
                    spdlog::level::info, {{"vetoedBy", check.vetoed_by}, {"target", std::to_string(target_seat)}});
    }
    return check.vetoed;
}

}  // namespace

ResolutionResult UseCardResolver::resolve(ResolutionContext& context) {
    Player* player = context.source_player;
    if (!context.action || !context.choice || player == nullptr) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.useCard.missingAction");
    }
    const ChoiceResult& choice = *context.choice;
    if (choice.selected_card_ids.size() != 1) {
        return ResolutionResult::failure(ResolutionErrorCode::CARD_NOT_FOUND, "resolution.useCard.selectOneCard");
    }
    Card* card = context.game->card(choice.selected_card_ids.front());
    if (card == nullptr || !player->hand.contains(card)) {
        return ResolutionResult::failure(ResolutionErrorCode::CARD_NOT_FOUND, "resolution.useCard.cardNotInHand");
    }
    const std::vector<Card*>& candidates = context.action->card_candidates;
    if (!candidates.empty() && std::find(candidates.begin(), candidates.end(), card) == candidates.end()) {
        return ResolutionResult::failure(ResolutionErrorCode::CARD_NOT_FOUND, "resolution.useCard.notACandidate");
    }

    RuleResult validation =
        context.rules->validateActionBeforeResolve(RuleContext{context.game, player}, *context.action, &choice);
    if (!validation.allowed) {
        context.log("ActionRejected", std::format("{} cannot use {}: {}", player->toString(), card->toString(),
                                                  toString(validation.reason)),
                    spdlog::level::warn);
        return ResolutionResult::failure(ResolutionErrorCode::RULE_VALIDATION_FAILED, validation.message_key);
    }

    std::unique_ptr<Resolver> effect;
    switch (card->subtype) {
        case CardSubType::ATTACK:
            effect = std::make_unique<AttackResolver>(card);
            break;
        case CardSubType::PEACH:
            effect = std::make_unique<HealResolver>(player->seat);
            break;
        case CardSubType::ARROW_VOLLEY:
            effect = std::make_unique<ArrowVolleyResolver>(card);
            break;
        case CardSubType::WEAPON:
        case CardSubType::ARMOR:
        case CardSubType::OFFENSIVE_HORSE:
        case CardSubType::DEFENSIVE_HORSE:
            effect = std::make_unique<EquipResolver>(card);
            break;
        case CardSubType::EVADE:
            break;
    }
    // Checked before the card or the use is spent.
    if (!effect) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.useCard.notUsable");
    }

    player->recordUse(card->subtype);
    if (!isEquipment(card->subtype)) {
        context.card_moves->discardFromHand(*player, {card});
    }

    CardUsedEvent used;
    used.seat = player->seat;
    used.card_id = card->id;
    used.subtype = card->subtype;
    used.target_seats = choice.selected_target_seats;
    context.publish(used);
    context.log("CardUsed", std::format("{} uses {}", player->toString(), card->toString()), spdlog::level::info,
                {{"card", card->name}, {"seat", std::to_string(player->seat)}});

    context.stack->push(std::move(effect), context);
    return ResolutionResult::ok();
}

AttackResolver::AttackResolver(Card* card) : card(card) {}

ResolutionResult AttackResolver::resolve(ResolutionContext& context) {
    if (!context.choice) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.attack.noChoice");
    }
    if (context.choice->selected_target_seats.empty()) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_TARGET, "resolution.attack.noTarget");
    }
    Player* defender = context.game->player(context.choice->selected_target_seats.front());
    if (defender == nullptr) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_TARGET, "resolution.attack.unknownTarget");
    }
    if (!defender->alive) {
        return ResolutionResult::failure(ResolutionErrorCode::TARGET_NOT_ALIVE, "resolution.attack.targetDead");
    }
    if (card == nullptr || context.game->card(card->id) != card) {
        return ResolutionResult::failure(ResolutionErrorCode::CARD_NOT_FOUND, "resolution.attack.cardNotFound");
    }
    Player* attacker = context.source_player;
    if (attacker == nullptr) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.attack.noAttacker");
    }

    if (vetoed(context, card, attacker->seat, defender->seat)) {
        return ResolutionResult::ok();
    }
    if (!context.canAskPlayers()) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.attack.choiceCallbackRequired");
    }
    context.ensureSession();

    DamageDescriptor damage;
    damage.source_seat = attacker->seat;
    damage.target_seat = defender->seat;
    damage.amount = context.game->config.default_attack_damage;
    damage.reason = "attack";
    damage.causing_card_id = card->id;

    auto request = std::make_shared<EvadeRequest>();
    request->defender = defender;
    request->attacker = attacker;
    request->source_event = SourceEvent{"attack", attacker->seat, defender->seat, card};
    request->response_type = ResponseType::ATTACK_EVADE;
    request->required_count =
        context.rules->requiredResponseCount(*context.game, *attacker, *defender, ResponseType::ATTACK_EVADE);

    context.log("AttackDeclared", std::format("{} attacks {}", attacker->toString(), defender->toString()),
                spdlog::level::info, {{"required", std::to_string(request->required_count)}});

    context.stack->push(std::make_unique<EvadeOutcomeResolver>(damage), context);
    if (hasAlternativeEvadeSource(context, *request)) {
        context.stack->push(std::make_unique<EvadeProviderChainResolver>(request, standardEvadeProviders()), context);
    } else {
        context.stack->push(evadeWindow(context, defender, ResponseType::ATTACK_EVADE, request->source_event,
                                        request->required_count),
                            context);
    }
    return ResolutionResult::ok();
}

EvadeOutcomeResolver::EvadeOutcomeResolver(DamageDescriptor damage) : damage(std::move(damage)) {
    this->damage.validate();
}

ResolutionResult EvadeOutcomeResolver::resolve(ResolutionContext& context) {
    ResolutionSession& session = context.requireSession(kind());
    const ResponseWindowResult* result = session.find(kLastResponseResult);
    if (result == nullptr) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.attackOutcome.noResponseResult");
    }
    if (result->state == ResponseWindowState::RESPONSE_SUCCESS) {
        context.log("AttackEvaded", std::format("Seat {} evades", damage.target_seat));
        return ResolutionResult::ok();
    }
    context.stack->push(std::make_unique<DamageResolver>(), context.withDamage(damage));
    return ResolutionResult::ok();
}

HealResolver::HealResolver(int target_seat, int amount) : target_seat(target_seat), amount(amount) {
    if (amount <= 0) {
        throw std::invalid_argument(std::format("Heal amount must be positive, got {}", amount));
    }
}

ResolutionResult HealResolver::resolve(ResolutionContext& context) {
    Player* target = context.game->player(target_seat);
    if (target == nullptr) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_TARGET, "resolution.heal.unknownTarget");
    }
    if (!target->alive) {
        return ResolutionResult::failure(ResolutionErrorCode::TARGET_NOT_ALIVE, "resolution.heal.targetDead");
    }
    if (!target->isWounded()) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.heal.fullHealth");
    }
    int current = target->heal(amount);

    HealedEvent healed;
    healed.seat = target->seat;
    healed.amount = amount;
    healed.current_health = current;
    context.publish(healed);
    context.log("Healed", std::format("{} heals {}", target->toString(), amount));
    return ResolutionResult::ok();
}

ArrowVolleyResolver::ArrowVolleyResolver(Card* card) : card(card) {}

ResolutionResult ArrowVolleyResolver::resolve(ResolutionContext& context) {
    Player* source = context.source_player;
    if (source == nullptr) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE, "resolution.arrowVolley.noSource");
    }
    if (card == nullptr || context.game->card(card->id) != card) {
        return ResolutionResult::failure(ResolutionErrorCode::CARD_NOT_FOUND, "resolution.arrowVolley.cardNotFound");
    }
    if (!context.canAskPlayers()) {
        return ResolutionResult::failure(ResolutionErrorCode::INVALID_STATE,
                                         "resolution.arrowVolley.choiceCallbackRequired");
    }
    context.ensureSession();

    std::vector<Player*> targets;
    for (Player* target : context.game->seatOrderAfter(source->seat)) {
        if (!vetoed(context, card, source->seat, target->seat)) {
            targets.push_back(target);
        }
    }

    // Pushed in reverse so the first target in seat order answers first.
    for (auto it = targets.rbegin(); it != targets.rend(); ++it) {
        Player* target = *it;
        DamageDescriptor damage;
        damage.source_seat = source->seat;
        damage.target_seat = target->seat;
        damage.amount = 1;
        damage.reason = "arrow_volley";
        damage.causing_card_id = card->id;

        context.stack->push(std::make_unique<EvadeOutcomeResolver>(damage), context);
        context.stack->push(evadeWindow(context, target, ResponseType::VOLLEY_EVADE,
                                        SourceEvent{"arrow_volley", source->seat, target->seat, card}),
                            context);
    }
    context.log("ArrowVolley", std::format("{} looses arrows at {} players", source->toString(), targets.size()));
    return ResolutionResult::ok();
}

EquipResolver::EquipResolver(Card* card) : card(card) {
    if (card == nullptr || !isEquipment(card->subtype)) {
        throw std::invalid_argument("EquipResolver needs an equipment card");
    }
}

ResolutionResult EquipResolver::resolve(ResolutionContext& context) {
    Player* player = context.source_player;
    if (player == nullptr || !player->alive) {
        return ResolutionResult::failure(ResolutionErrorCode::TARGET_NOT_ALIVE, "resolution.equip.noOwner");
    }
    if (!player->hand.contains(card)) {
        return ResolutionResult::failure(ResolutionErrorCode::CARD_NOT_FOUND, "resolution.equip.cardNotInHand");
    }

    Card* replaced = player->equipped(card->subtype);
    if (replaced) {
        context.card_moves->moveCard(replaced, &player->equipment, &context.game->discard_pile, MoveOrdering::TO_TOP,
                                     "equip.replace");
    }
    context.card_moves->moveCard(card, &player->hand, &player->equipment, MoveOrdering::TO_BOTTOM, "equip");

    EquipmentChangedEvent changed;
    changed.seat = player->seat;
    changed.equipped = card;
    changed.removed = replaced;
    context.publish(changed);
    context.log("Equipped", std::format("{} equips {}", player->toString(), card->toString()));
    return ResolutionResult::ok();
}
