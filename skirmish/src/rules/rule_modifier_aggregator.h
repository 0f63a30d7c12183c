#pragma once

#include <initializer_list>

#include "rules/rule_modifier.h"

class AbilityQueryService;

// Folds the opinions of every active ability over a base value. Abilities are queried on every
// call, never cached, and each query combines according to combinePolicy().
class RuleModifierAggregator {
public:
    explicit RuleModifierAggregator(const AbilityQueryService* abilities);

    RuleResult canUseCard(const RuleResult& base, const CardUsageContext& context) const;
    RuleResult canRespond(const RuleResult& base, const ResponseContext& context, const Card& card) const;
    RuleResult validateAction(const RuleResult& base,
                              const RuleContext& context,
                              const ActionDescriptor& action,
                              const ChoiceResult* choice) const;
    int maxUsesPerTurn(int base, const Game& game, const Player& user, CardSubType subtype) const;
    int attackDistance(int base, const Game& game, const Player& from, const Player& to) const;
    // Defender's modifiers apply first, then the attacker's. Never below 1.
    int seatDistance(int base, const Game& game, const Player& from, const Player& to) const;
    // Never below 0.
    int drawCount(int base, const Game& game, const Player& drawer) const;
    int requiredResponseCount(int base,
                              const Game& game,
                              const Player& source,
                              const Player& responder,
                              ResponseType type) const;

private:
    const AbilityQueryService* abilities;

    template <typename V, typename Hook>
    V fold(RuleQuery query, V current, const Game& game, std::initializer_list<const Player*> players, Hook hook) const;
};
