#pragma once

#include <bitset>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>

#include "rules/card.h"
#include "rules/rule_context.h"
#include "rules/rule_result.h"

class Game;
class Player;
class ActionDescriptor;
class ChoiceResult;

enum class RuleQuery {
    CAN_USE_CARD,
    CAN_RESPOND,
    VALIDATE_ACTION,
    MAX_USES_PER_TURN,
    ATTACK_DISTANCE,
    SEAT_DISTANCE,
    DRAW_COUNT,
    REQUIRED_RESPONSE_COUNT,
    COUNT
};

constexpr size_t kRuleQueryCount = static_cast<size_t>(RuleQuery::COUNT);

using RuleHookSet = std::bitset<kRuleQueryCount>;

RuleHookSet ruleHooks(std::initializer_list<RuleQuery> queries);

enum class CombinePolicy {
    // The last non-abstaining modifier replaces the running value.
    OVERRIDE,
    // Each non-abstaining modifier returns a delta added to the running value.
    ADDITIVE
};

constexpr CombinePolicy combinePolicy(RuleQuery query) {
    switch (query) {
        case RuleQuery::SEAT_DISTANCE:
        case RuleQuery::DRAW_COUNT:
            return CombinePolicy::ADDITIVE;
        default:
            return CombinePolicy::OVERRIDE;
    }
}

std::string toString(RuleQuery query);

// An ability's opinion on rule queries. Hooks return std::nullopt to abstain and are only
// consulted for queries present in ruleHooks().
class RuleModifier {
public:
    virtual ~RuleModifier() = default;

    virtual RuleHookSet ruleHooks() const;
    bool participatesIn(RuleQuery query) const;

    virtual std::optional<RuleResult> modifyCanUseCard(const RuleResult& current, const CardUsageContext& context) const;
    virtual std::optional<RuleResult> modifyCanRespond(const RuleResult& current,
                                                       const ResponseContext& context,
                                                       const Card& card) const;
    virtual std::optional<RuleResult> modifyValidateAction(const RuleResult& current,
                                                           const RuleContext& context,
                                                           const ActionDescriptor& action,
                                                           const ChoiceResult* choice) const;
    virtual std::optional<int> modifyMaxUsesPerTurn(int current,
                                                    const Game& game,
                                                    const Player& user,
                                                    CardSubType subtype) const;
    virtual std::optional<int> modifyAttackDistance(int current,
                                                    const Game& game,
                                                    const Player& from,
                                                    const Player& to) const;
    // Additive: returns a delta.
    virtual std::optional<int> modifySeatDistance(int current,
                                                  const Game& game,
                                                  const Player& from,
                                                  const Player& to) const;
    // Additive: returns a delta.
    virtual std::optional<int> modifyDrawCount(int current, const Game& game, const Player& drawer) const;
    virtual std::optional<int> modifyRequiredResponseCount(int current,
                                                           const Game& game,
                                                           const Player& source,
                                                           const Player& responder,
                                                           ResponseType type) const;
};
