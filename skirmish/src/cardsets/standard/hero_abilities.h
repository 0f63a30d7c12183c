// hero_abilities.h
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "abilities/ability.h"
#include "abilities/response_abilities.h"
#include "resolution/resolver.h"

// Draws one extra card in the draw phase.
class YingziAbility : public Ability {
public:
    std::string id() const override { return "yingzi"; }
    AbilityKind kind() const override { return AbilityKind::LOCKED; }
    RuleHookSet ruleHooks() const override;
    std::optional<int> modifyDrawCount(int current, const Game& game, const Player& drawer) const override;
};

// No limit on attacks per turn.
class RoarAbility : public Ability {
public:
    std::string id() const override { return "roar"; }
    AbilityKind kind() const override { return AbilityKind::LOCKED; }
    RuleHookSet ruleHooks() const override;
    std::optional<int> modifyMaxUsesPerTurn(int current, const Game& game, const Player& user,
                                            CardSubType subtype) const override;
};

// Attacks from the owner need two evades.
class WushuangAbility : public Ability {
public:
    std::string id() const override { return "wushuang"; }
    AbilityKind kind() const override { return AbilityKind::LOCKED; }
    RuleHookSet ruleHooks() const override;
    std::optional<int> modifyRequiredResponseCount(int current, const Game& game, const Player& source,
                                                   const Player& responder, ResponseType type) const override;
};

// Others are one seat closer to the owner.
class HorsemanshipAbility : public Ability {
public:
    std::string id() const override { return "horsemanship"; }
    AbilityKind kind() const override { return AbilityKind::LOCKED; }
    RuleHookSet ruleHooks() const override;
    std::optional<int> modifySeatDistance(int current, const Game& game, const Player& from,
                                          const Player& to) const override;
};

// Attacks in the owner's hand answer as evades.
class LongdanAbility : public Ability {
public:
    std::string id() const override { return "longdan"; }
    AbilityKind kind() const override { return AbilityKind::LOCKED; }
    RuleHookSet ruleHooks() const override;
    std::optional<RuleResult> modifyCanRespond(const RuleResult& current, const ResponseContext& context,
                                               const Card& card) const override;
};

// After taking damage, the owner may take the card that caused it.
class JianxiongAbility : public Ability {
public:
    std::string id() const override { return "jianxiong"; }
    AbilityKind kind() const override { return AbilityKind::TRIGGER; }

protected:
    void subscribe(EventBus& event_bus) override;

private:
    void onDamageResolved(DamageResolvedEvent& event);
};

// After taking damage from another player, the owner judges; anything but a heart makes the
// source discard two cards or take one damage.
class GanglieAbility : public Ability {
public:
    std::string id() const override { return "ganglie"; }
    AbilityKind kind() const override { return AbilityKind::TRIGGER; }

protected:
    void subscribe(EventBus& event_bus) override;

private:
    void onDamageResolved(DamageResolvedEvent& event);
};

class GanglieResolver : public Resolver {
public:
    GanglieResolver(int owner_seat, int source_seat);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "ganglie"; }

private:
    int owner_seat;
    int source_seat;

    bool sourceDiscards(ResolutionContext& context, Player& source);
};

// Lord ability: Wei allies may evade on the owner's behalf.
class HujiaAbility : public Ability, public ResponseAssistanceAbility {
public:
    static constexpr const char* kFaction = "wei";

    std::string id() const override { return "hujia"; }
    AbilityKind kind() const override { return AbilityKind::ACTIVE; }
    bool isLordAbility() const override { return true; }

    bool canProvideAssistance(const Game& game, const Player& owner, ResponseType type) const override;
    std::vector<Player*> assistants(const Game& game, const Player& owner) const override;
};
