// rule_modifier.cpp
#include "rule_modifier.h"

#include <stdexcept>

RuleHookSet ruleHooks(std::initializer_list<RuleQuery> queries) {
    RuleHookSet set;
    for (RuleQuery query : queries) {
        if (query == RuleQuery::COUNT) {
            throw std::invalid_argument("RuleQuery::COUNT is not a query");
        }
        set.set(static_cast<size_t>(query));
    }
    return set;
}

std::string toString(RuleQuery query) {
    switch (query) {
        case RuleQuery::CAN_USE_CARD:
            return "CanUseCard";
        case RuleQuery::CAN_RESPOND:
            return "CanRespond";
        case RuleQuery::VALIDATE_ACTION:
            return "ValidateAction";
        case RuleQuery::MAX_USES_PER_TURN:
            return "MaxUsesPerTurn";
        case RuleQuery::ATTACK_DISTANCE:
            return "AttackDistance";
        case RuleQuery::SEAT_DISTANCE:
            return "SeatDistance";
        case RuleQuery::DRAW_COUNT:
            return "DrawCount";
        case RuleQuery::REQUIRED_RESPONSE_COUNT:
            return "RequiredResponseCount";
        case RuleQuery::COUNT:
            break;
    }
    throw std::invalid_argument("Unknown rule query");
}

RuleHookSet RuleModifier::ruleHooks() const {
    return {};
}

bool RuleModifier::participatesIn(RuleQuery query) const {
    return ruleHooks().test(static_cast<size_t>(query));
}

std::optional<RuleResult> RuleModifier::modifyCanUseCard(const RuleResult&, const CardUsageContext&) const {
    return std::nullopt;
}

std::optional<RuleResult> RuleModifier::modifyCanRespond(const RuleResult&, const ResponseContext&, const Card&) const {
    return std::nullopt;
}

std::optional<RuleResult> RuleModifier::modifyValidateAction(const RuleResult&,
                                                             const RuleContext&,
                                                             const ActionDescriptor&,
                                                             const ChoiceResult*) const {
    return std::nullopt;
}

std::optional<int> RuleModifier::modifyMaxUsesPerTurn(int, const Game&, const Player&, CardSubType) const {
    return std::nullopt;
}

std::optional<int> RuleModifier::modifyAttackDistance(int, const Game&, const Player&, const Player&) const {
    return std::nullopt;
}

std::optional<int> RuleModifier::modifySeatDistance(int, const Game&, const Player&, const Player&) const {
    return std::nullopt;
}

std::optional<int> RuleModifier::modifyDrawCount(int, const Game&, const Player&) const {
    return std::nullopt;
}

std::optional<int> RuleModifier::modifyRequiredResponseCount(int,
                                                             const Game&,
                                                             const Player&,
                                                             const Player&,
                                                             ResponseType) const {
    return std::nullopt;
}
