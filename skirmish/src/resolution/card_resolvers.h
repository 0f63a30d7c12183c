#pragma once

#include <string>

#include "resolution/resolver.h"
#include "rules/damage.h"

class Card;

// Entry point for every played card: validates the action, takes the card out of hand and
// pushes the card's own resolver.
class UseCardResolver : public Resolver {
public:
    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "use-card"; }
};

class AttackResolver : public Resolver {
public:
    explicit AttackResolver(Card* card);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "attack"; }

private:
    Card* card;
};

// Reads the last response window result and applies the pending damage unless it was evaded.
class EvadeOutcomeResolver : public Resolver {
public:
    explicit EvadeOutcomeResolver(DamageDescriptor damage);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "attack-outcome"; }

private:
    DamageDescriptor damage;
};

class HealResolver : public Resolver {
public:
    HealResolver(int target_seat, int amount = 1);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "heal"; }

private:
    int target_seat;
    int amount;
};

// Every other living player must evade or take one damage, in seat order after the user.
class ArrowVolleyResolver : public Resolver {
public:
    explicit ArrowVolleyResolver(Card* card);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "arrow-volley"; }

private:
    Card* card;
};

class EquipResolver : public Resolver {
public:
    explicit EquipResolver(Card* card);

    ResolutionResult resolve(ResolutionContext& context) override;
    std::string kind() const override { return "equip"; }

private:
    Card* card;
};
