#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rules/card.h"
#include "rules/damage.h"
#include "rules/rule_context.h"

class Game;
class Zone;
class ResolutionContext;

// Every event carries the game and, when raised inside a resolution chain, that chain's context.
struct GameEvent {
    Game* game = nullptr;
    ResolutionContext* context = nullptr;
};

enum class MoveTiming {
    BEFORE,
    AFTER
};

struct CardMovedEvent : GameEvent {
    MoveTiming timing = MoveTiming::AFTER;
    std::vector<int> card_ids;
    const Zone* source = nullptr;
    const Zone* target = nullptr;
    std::string reason;
};

struct CardUsedEvent : GameEvent {
    int seat = 0;
    int card_id = 0;
    CardSubType subtype = CardSubType::ATTACK;
    std::vector<int> target_seats;
};

// Raised before a card takes effect on a target. Handlers may veto.
struct CardEffectCheckEvent : GameEvent {
    const Card* card = nullptr;
    int source_seat = 0;
    int target_seat = 0;
    bool vetoed = false;
    std::string vetoed_by;
};

// Handlers may prevent a preventable damage, change its amount or redirect it.
struct BeforeDamageEvent : GameEvent {
    DamageDescriptor damage;
    bool prevented = false;
    std::string prevented_by;
};

struct DamageAppliedEvent : GameEvent {
    DamageDescriptor damage;
    int target_seat = 0;
    int previous_health = 0;
    int current_health = 0;
};

struct DamageResolvedEvent : GameEvent {
    DamageDescriptor damage;
    int target_seat = 0;
    int previous_health = 0;
    int current_health = 0;
};

struct DyingStartEvent : GameEvent {
    int seat = 0;
    std::optional<int> source_seat;
};

struct PlayerDiedEvent : GameEvent {
    int seat = 0;
    std::optional<int> killer_seat;
};

struct HealedEvent : GameEvent {
    int seat = 0;
    int amount = 0;
    int current_health = 0;
};

struct ResponsePlayedEvent : GameEvent {
    int seat = 0;
    int card_id = 0;
    ResponseType response_type = ResponseType::ATTACK_EVADE;
};

struct EquipmentChangedEvent : GameEvent {
    int seat = 0;
    Card* equipped = nullptr;
    Card* removed = nullptr;
};

struct JudgementCompletedEvent : GameEvent {
    int seat = 0;
    int card_id = 0;
    std::string reason;
    bool success = false;
};
