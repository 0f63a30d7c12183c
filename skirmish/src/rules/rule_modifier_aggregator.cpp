// rule_modifier_aggregator.cpp
#include "rule_modifier_aggregator.h"

#include "abilities/ability.h"
#include "abilities/ability_query_service.h"
#include "rules/game.h"

#include <algorithm>
#include <type_traits>

RuleModifierAggregator::RuleModifierAggregator(const AbilityQueryService* abilities) : abilities(abilities) {}

template <typename V, typename Hook>
V RuleModifierAggregator::fold(RuleQuery query,
                               V current,
                               const Game& game,
                               std::initializer_list<const Player*> players,
                               Hook hook) const {
    if (abilities == nullptr) {
        return current;
    }
    for (const Player* player : players) {
        if (player == nullptr) {
            continue;
        }
        for (const Ability* ability : abilities->activeAbilities(game, *player)) {
            if (!ability->participatesIn(query)) {
                continue;
            }
            std::optional<V> opinion = hook(*ability, current);
            if (!opinion) {
                continue;
            }
            if constexpr (std::is_same_v<V, int>) {
                current = combinePolicy(query) == CombinePolicy::ADDITIVE ? current + *opinion : *opinion;
            } else {
                static_assert(std::is_same_v<V, RuleResult>);
                current = *opinion;
            }
        }
    }
    return current;
}

RuleResult RuleModifierAggregator::canUseCard(const RuleResult& base, const CardUsageContext& context) const {
    return fold(RuleQuery::CAN_USE_CARD, base, *context.game, {context.user},
                [&context](const Ability& ability, const RuleResult& current) {
                    return ability.modifyCanUseCard(current, context);
                });
}

RuleResult RuleModifierAggregator::canRespond(const RuleResult& base,
                                              const ResponseContext& context,
                                              const Card& card) const {
    return fold(RuleQuery::CAN_RESPOND, base, *context.game, {context.responder},
                [&context, &card](const Ability& ability, const RuleResult& current) {
                    return ability.modifyCanRespond(current, context, card);
                });
}

RuleResult RuleModifierAggregator::validateAction(const RuleResult& base,
                                                  const RuleContext& context,
                                                  const ActionDescriptor& action,
                                                  const ChoiceResult* choice) const {
    return fold(RuleQuery::VALIDATE_ACTION, base, *context.game, {context.player},
                [&](const Ability& ability, const RuleResult& current) {
                    return ability.modifyValidateAction(current, context, action, choice);
                });
}

int RuleModifierAggregator::maxUsesPerTurn(int base, const Game& game, const Player& user, CardSubType subtype) const {
    return fold(RuleQuery::MAX_USES_PER_TURN, base, game, {&user},
                [&](const Ability& ability, int current) {
                    return ability.modifyMaxUsesPerTurn(current, game, user, subtype);
                });
}

int RuleModifierAggregator::attackDistance(int base, const Game& game, const Player& from, const Player& to) const {
    return fold(RuleQuery::ATTACK_DISTANCE, base, game, {&from},
                [&](const Ability& ability, int current) {
                    return ability.modifyAttackDistance(current, game, from, to);
                });
}

int RuleModifierAggregator::seatDistance(int base, const Game& game, const Player& from, const Player& to) const {
    const Player* attacker = &from == &to ? nullptr : &from;
    int distance = fold(RuleQuery::SEAT_DISTANCE, base, game, {&to, attacker},
                        [&](const Ability& ability, int current) {
                            return ability.modifySeatDistance(current, game, from, to);
                        });
    return std::max(1, distance);
}

int RuleModifierAggregator::drawCount(int base, const Game& game, const Player& drawer) const {
    int count = fold(RuleQuery::DRAW_COUNT, base, game, {&drawer},
                     [&](const Ability& ability, int current) {
                         return ability.modifyDrawCount(current, game, drawer);
                     });
    return std::max(0, count);
}

int RuleModifierAggregator::requiredResponseCount(int base,
                                                  const Game& game,
                                                  const Player& source,
                                                  const Player& responder,
                                                  ResponseType type) const {
    int count = fold(RuleQuery::REQUIRED_RESPONSE_COUNT, base, game, {&source},
                     [&](const Ability& ability, int current) {
                         return ability.modifyRequiredResponseCount(current, game, source, responder, type);
                     });
    return std::max(1, count);
}
