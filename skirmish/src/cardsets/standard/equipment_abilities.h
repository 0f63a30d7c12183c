// equipment_abilities.h
#pragma once

#include <optional>
#include <string>

#include "abilities/ability.h"
#include "abilities/response_abilities.h"

class ZhugeCrossbowAbility : public Ability {
public:
    std::string id() const override { return "zhuge_crossbow"; }
    AbilityKind kind() const override { return AbilityKind::LOCKED; }
    RuleHookSet ruleHooks() const override;
    std::optional<int> modifyMaxUsesPerTurn(int current, const Game& game, const Player& user,
                                            CardSubType subtype) const override;
};

// Replaces the owner's attack range.
class WeaponRangeAbility : public Ability {
public:
    WeaponRangeAbility(std::string ability_id, int range);

    std::string id() const override { return ability_id; }
    AbilityKind kind() const override { return AbilityKind::LOCKED; }
    RuleHookSet ruleHooks() const override;
    std::optional<int> modifyAttackDistance(int current, const Game& game, const Player& from,
                                            const Player& to) const override;

private:
    std::string ability_id;
    int range;
};

class DefensiveHorseAbility : public Ability {
public:
    std::string id() const override { return "defensive_horse"; }
    AbilityKind kind() const override { return AbilityKind::LOCKED; }
    RuleHookSet ruleHooks() const override;
    std::optional<int> modifySeatDistance(int current, const Game& game, const Player& from,
                                          const Player& to) const override;
};

class OffensiveHorseAbility : public Ability {
public:
    std::string id() const override { return "offensive_horse"; }
    AbilityKind kind() const override { return AbilityKind::LOCKED; }
    RuleHookSet ruleHooks() const override;
    std::optional<int> modifySeatDistance(int current, const Game& game, const Player& from,
                                          const Player& to) const override;
};

// Black attacks have no effect on the owner.
class RenwangShieldAbility : public Ability {
public:
    std::string id() const override { return "renwang_shield"; }
    AbilityKind kind() const override { return AbilityKind::LOCKED; }

protected:
    void subscribe(EventBus& event_bus) override;
};

// A red judgement counts as one evade.
class BaguaArrayAbility : public Ability, public ResponseEnhancementAbility {
public:
    std::string id() const override { return "bagua_array"; }
    AbilityKind kind() const override { return AbilityKind::TRIGGER; }

    bool canProvideResponse(const Game& game, const Player& owner, const EvadeRequest& request) const override;
    bool executeAlternativeResponse(ResolutionContext& context, Player& owner, EvadeRequest& request) override;
};
