#pragma once

#include <vector>

#include "agents/action.h"
#include "agents/choice.h"
#include "rules/rule_context.h"
#include "rules/rule_modifier_aggregator.h"
#include "rules/rule_result.h"

class Card;
class Game;
class Player;
class AbilityQueryService;

class RuleService {
public:
    virtual ~RuleService() = default;

    virtual std::vector<ActionDescriptor> availableActions(const RuleContext& context) const = 0;
    virtual RuleResult validateActionBeforeResolve(const RuleContext& context,
                                                   const ActionDescriptor& action,
                                                   const ChoiceResult* choice) const = 0;
    virtual std::vector<Card*> legalResponseCards(const ResponseContext& context) const = 0;
    virtual RuleResult canRespondWithCard(const ResponseContext& context, const Card& card) const = 0;
    virtual RuleResult canUseCard(const CardUsageContext& context) const = 0;

    virtual std::vector<Player*> legalAttackTargets(const Game& game, const Player& attacker) const = 0;
    virtual int seatDistance(const Game& game, const Player& from, const Player& to) const = 0;
    virtual int attackDistance(const Game& game, const Player& from, const Player& to) const = 0;
    virtual bool isWithinAttackRange(const Game& game, const Player& from, const Player& to) const = 0;
    virtual int maxUsesPerTurn(const Game& game, const Player& user, CardSubType subtype) const = 0;
    virtual int drawCount(const Game& game, const Player& drawer) const = 0;
    virtual int requiredResponseCount(const Game& game,
                                      const Player& source,
                                      const Player& responder,
                                      ResponseType type) const = 0;
};

// Base game rules with every ability opinion folded in through a RuleModifierAggregator.
class BasicRuleService : public RuleService {
public:
    static constexpr const char* kUseAttack = "use_attack";
    static constexpr const char* kUsePeach = "use_peach";
    static constexpr const char* kUseArrowVolley = "use_arrow_volley";
    static constexpr const char* kEquip = "equip";

    explicit BasicRuleService(const AbilityQueryService* abilities);

    std::vector<ActionDescriptor> availableActions(const RuleContext& context) const override;
    RuleResult validateActionBeforeResolve(const RuleContext& context,
                                           const ActionDescriptor& action,
                                           const ChoiceResult* choice) const override;
    std::vector<Card*> legalResponseCards(const ResponseContext& context) const override;
    RuleResult canRespondWithCard(const ResponseContext& context, const Card& card) const override;
    RuleResult canUseCard(const CardUsageContext& context) const override;

    std::vector<Player*> legalAttackTargets(const Game& game, const Player& attacker) const override;
    int seatDistance(const Game& game, const Player& from, const Player& to) const override;
    int attackDistance(const Game& game, const Player& from, const Player& to) const override;
    bool isWithinAttackRange(const Game& game, const Player& from, const Player& to) const override;
    int maxUsesPerTurn(const Game& game, const Player& user, CardSubType subtype) const override;
    int drawCount(const Game& game, const Player& drawer) const override;
    int requiredResponseCount(const Game& game,
                              const Player& source,
                              const Player& responder,
                              ResponseType type) const override;

private:
    RuleModifierAggregator modifiers;

    RuleResult baseCanUseCard(const CardUsageContext& context) const;
    int baseSeatDistance(const Game& game, const Player& from, const Player& to) const;
};
