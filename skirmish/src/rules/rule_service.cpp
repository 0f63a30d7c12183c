// rule_service.cpp
#include "rule_service.h"

#include "rules/game.h"

#include <algorithm>
#include <climits>
#include <map>
#include <string>

namespace {

// The one action that may play a card of this subtype; nullptr for response-only cards.
const char* actionIdFor(CardSubType subtype) {
    switch (subtype) {
        case CardSubType::ATTACK:
            return BasicRuleService::kUseAttack;
        case CardSubType::PEACH:
            return BasicRuleService::kUsePeach;
        case CardSubType::ARROW_VOLLEY:
            return BasicRuleService::kUseArrowVolley;
        case CardSubType::WEAPON:
        case CardSubType::ARMOR:
        case CardSubType::OFFENSIVE_HORSE:
        case CardSubType::DEFENSIVE_HORSE:
            return BasicRuleService::kEquip;
        case CardSubType::EVADE:
            return nullptr;
    }
    return nullptr;
}

// Attacks name exactly one target; every other card finds its own targets.
int chosenTargetCount(CardSubType subtype) {
    return subtype == CardSubType::ATTACK ? 1 : 0;
}

}  // namespace

BasicRuleService::BasicRuleService(const AbilityQueryService* abilities) : modifiers(abilities) {}

std::vector<ActionDescriptor> BasicRuleService::availableActions(const RuleContext& context) const {
    std::vector<ActionDescriptor> actions;
    const Game& game = *context.game;
    const Player& player = *context.player;
    if (!player.alive || game.currentPlayer() != &player || game.phase != Phase::PLAY) {
        return actions;
    }

    std::map<CardSubType, std::vector<Card*>> usable;
    for (Card* card : player.hand.cards) {
        CardUsageContext usage{&game, &player, card, {}};
        if (canUseCard(usage).allowed) {
            usable[card->subtype].push_back(card);
        }
    }

    if (usable.contains(CardSubType::ATTACK) && !legalAttackTargets(game, player).empty()) {
        actions.emplace_back(kUseAttack, "action.useAttack", true,
                             TargetConstraints{1, 1, TargetType::SINGLE_OTHER}, usable[CardSubType::ATTACK]);
    }
    if (usable.contains(CardSubType::PEACH)) {
        actions.emplace_back(kUsePeach, "action.usePeach", false,
                             TargetConstraints{0, 0, TargetType::SELF}, usable[CardSubType::PEACH]);
    }
    if (usable.contains(CardSubType::ARROW_VOLLEY)) {
        actions.emplace_back(kUseArrowVolley, "action.useArrowVolley", false,
                             TargetConstraints{0, 0, TargetType::ALL_OTHERS}, usable[CardSubType::ARROW_VOLLEY]);
    }

    std::vector<Card*> equipment;
    for (const auto& [subtype, cards] : usable) {
        if (isEquipment(subtype)) {
            equipment.insert(equipment.end(), cards.begin(), cards.end());
        }
    }
    if (!equipment.empty()) {
        actions.emplace_back(kEquip, "action.equip", false, TargetConstraints{0, 0, TargetType::SELF}, equipment);
    }
    return actions;
}

RuleResult BasicRuleService::validateActionBeforeResolve(const RuleContext& context,
                                                         const ActionDescriptor& action,
                                                         const ChoiceResult* choice) const {
    const Game& game = *context.game;
    const Player& player = *context.player;

    RuleResult base = RuleResult::allow();
    if (choice == nullptr || choice->selected_card_ids.size() != 1) {
        base = RuleResult::deny(RuleReason::INVALID_SELECTION, "rule.action.selectOneCard");
    } else if (!action.offersCard(choice->selected_card_ids.front())) {
        base = RuleResult::deny(RuleReason::INVALID_SELECTION, "rule.action.cardNotOffered");
    } else {
        const Card* card = game.card(choice->selected_card_ids.front());
        const TargetConstraints& constraints = action.target_constraints;
        int target_count = static_cast<int>(choice->selected_target_seats.size());

        std::vector<const Player*> targets;
        for (int seat : choice->selected_target_seats) {
            targets.push_back(game.player(seat));
        }

        if (card == nullptr || !player.hand.contains(card)) {
            base = RuleResult::deny(RuleReason::CARD_NOT_OWNED, "rule.action.cardNotInHand");
        } else if (actionIdFor(card->subtype) == nullptr) {
            base = RuleResult::deny(RuleReason::RESPONSE_ONLY, "rule.use.evadeIsResponseOnly");
        } else if (action.action_id != actionIdFor(card->subtype)) {
            base = RuleResult::deny(RuleReason::INVALID_SELECTION, "rule.action.wrongAction");
        } else if (target_count != chosenTargetCount(card->subtype)) {
            base = RuleResult::deny(RuleReason::INVALID_TARGET, "rule.action.targetCount");
        } else if (action.requires_targets &&
                   (target_count < constraints.min_targets || target_count > constraints.max_targets)) {
            base = RuleResult::deny(RuleReason::INVALID_TARGET, "rule.action.targetCount");
        } else if (std::find(targets.begin(), targets.end(), nullptr) != targets.end()) {
            base = RuleResult::deny(RuleReason::INVALID_TARGET, "rule.action.unknownTarget");
        } else {
            base = canUseCard(CardUsageContext{&game, &player, card, targets});
        }
    }
    return modifiers.validateAction(base, context, action, choice);
}

std::vector<Card*> BasicRuleService::legalResponseCards(const ResponseContext& context) const {
    std::vector<Card*> legal;
    if (context.responder == nullptr) {
        return legal;
    }
    for (Card* card : context.responder->hand.cards) {
        if (canRespondWithCard(context, *card).allowed) {
            legal.push_back(card);
        }
    }
    return legal;
}

RuleResult BasicRuleService::canRespondWithCard(const ResponseContext& context, const Card& card) const {
    const Player* responder = context.responder;
    RuleResult base = RuleResult::allow();
    if (responder == nullptr || !responder->alive) {
        base = RuleResult::deny(RuleReason::PLAYER_DEAD, "rule.response.responderDead");
    } else if (!responder->hand.contains(&card)) {
        base = RuleResult::deny(RuleReason::CARD_NOT_OWNED, "rule.response.cardNotInHand");
    } else if (card.subtype != expectedResponseCard(context.response_type)) {
        base = RuleResult::deny(RuleReason::RESPONSE_NOT_ALLOWED, "rule.response.wrongCard");
    }
    return modifiers.canRespond(base, context, card);
}

RuleResult BasicRuleService::baseCanUseCard(const CardUsageContext& context) const {
    const Game& game = *context.game;
    const Player& user = *context.user;
    const Card& card = *context.card;

    if (!user.alive) {
        return RuleResult::deny(RuleReason::PLAYER_DEAD, "rule.use.userDead");
    }
    if (!user.hand.contains(&card)) {
        return RuleResult::deny(RuleReason::CARD_NOT_OWNED, "rule.use.cardNotInHand");
    }
    if (game.currentPlayer() != &user) {
        return RuleResult::deny(RuleReason::NOT_ACTIVE_PLAYER, "rule.use.notActivePlayer");
    }
    if (game.phase != Phase::PLAY) {
        return RuleResult::deny(RuleReason::PHASE_NOT_ALLOWED, "rule.use.notPlayPhase");
    }

    switch (card.subtype) {
        case CardSubType::ATTACK:
            if (user.usesThisTurn(CardSubType::ATTACK) >= maxUsesPerTurn(game, user, CardSubType::ATTACK)) {
                return RuleResult::deny(RuleReason::USAGE_LIMIT_REACHED, "rule.use.attackLimit");
            }
            for (const Player* target : context.targets) {
                if (target == &user || !target->alive) {
                    return RuleResult::deny(RuleReason::INVALID_TARGET, "rule.use.invalidAttackTarget");
                }
                if (!isWithinAttackRange(game, user, *target)) {
                    return RuleResult::deny(RuleReason::TARGET_OUT_OF_RANGE, "rule.use.outOfRange");
                }
            }
            return RuleResult::allow();
        case CardSubType::EVADE:
            return RuleResult::deny(RuleReason::RESPONSE_ONLY, "rule.use.evadeIsResponseOnly");
        case CardSubType::PEACH:
            if (!user.isWounded()) {
                return RuleResult::deny(RuleReason::ALREADY_FULL_HEALTH, "rule.use.fullHealth");
            }
            return RuleResult::allow();
        case CardSubType::ARROW_VOLLEY:
            if (game.seatOrderAfter(user.seat).empty()) {
                return RuleResult::deny(RuleReason::NO_LEGAL_TARGET, "rule.use.noOtherPlayers");
            }
            return RuleResult::allow();
        case CardSubType::WEAPON:
        case CardSubType::ARMOR:
        case CardSubType::OFFENSIVE_HORSE:
        case CardSubType::DEFENSIVE_HORSE:
            return RuleResult::allow();
    }
    return RuleResult::deny(RuleReason::INVALID_SELECTION, "rule.use.unknownCard");
}

RuleResult BasicRuleService::canUseCard(const CardUsageContext& context) const {
    return modifiers.canUseCard(baseCanUseCard(context), context);
}

std::vector<Player*> BasicRuleService::legalAttackTargets(const Game& game, const Player& attacker) const {
    std::vector<Player*> targets;
    for (Player* candidate : game.seatOrderAfter(attacker.seat)) {
        if (isWithinAttackRange(game, attacker, *candidate)) {
            targets.push_back(candidate);
        }
    }
    return targets;
}

int BasicRuleService::baseSeatDistance(const Game& game, const Player& from, const Player& to) const {
    if (&from == &to) {
        return 0;
    }
    // Count only living players unless one side is already dead.
    std::vector<const Player*> ring;
    for (const std::unique_ptr<Player>& player : game.players) {
        if (player->alive || !from.alive || !to.alive) {
            ring.push_back(player.get());
        }
    }
    auto from_it = std::find(ring.begin(), ring.end(), &from);
    auto to_it = std::find(ring.begin(), ring.end(), &to);
    int count = static_cast<int>(ring.size());
    int clockwise = static_cast<int>(((to_it - from_it) % count + count) % count);
    return std::max(1, std::min(clockwise, count - clockwise));
}

int BasicRuleService::seatDistance(const Game& game, const Player& from, const Player& to) const {
    if (&from == &to) {
        return 0;
    }
    return modifiers.seatDistance(baseSeatDistance(game, from, to), game, from, to);
}

int BasicRuleService::attackDistance(const Game& game, const Player& from, const Player& to) const {
    return modifiers.attackDistance(game.config.base_attack_distance, game, from, to);
}

bool BasicRuleService::isWithinAttackRange(const Game& game, const Player& from, const Player& to) const {
    return seatDistance(game, from, to) <= attackDistance(game, from, to);
}

int BasicRuleService::maxUsesPerTurn(const Game& game, const Player& user, CardSubType subtype) const {
    int base = subtype == CardSubType::ATTACK ? game.config.base_attacks_per_turn : INT_MAX;
    return modifiers.maxUsesPerTurn(base, game, user, subtype);
}

int BasicRuleService::drawCount(const Game& game, const Player& drawer) const {
    return modifiers.drawCount(game.config.base_draw_count, game, drawer);
}

int BasicRuleService::requiredResponseCount(const Game& game,
                                            const Player& source,
                                            const Player& responder,
                                            ResponseType type) const {
    return modifiers.requiredResponseCount(1, game, source, responder, type);
}
