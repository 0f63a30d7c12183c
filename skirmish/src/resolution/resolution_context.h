#pragma once

#include <memory>
#include <optional>
#include <string>

#include "agents/action.h"
#include "agents/choice.h"
#include "events/event_bus.h"
#include "logging/log_sink.h"
#include "resolution/resolution_session.h"
#include "rules/damage.h"

class Game;
class Player;
class ResolutionStack;
class CardMoveService;
class RuleService;
class AbilityQueryService;
class JudgementService;

// Everything a resolver needs. Copies share the stack, the services and the session.
class ResolutionContext {
public:
    Game* game;
    Player* source_player;
    std::optional<ActionDescriptor> action;
    std::optional<ChoiceResult> choice;
    ResolutionStack* stack;
    CardMoveService* card_moves;
    RuleService* rules;
    std::optional<DamageDescriptor> pending_damage;
    LogSink* log_sink = nullptr;
    ChoiceCallback get_player_choice;
    std::shared_ptr<ResolutionSession> session;
    EventBus* event_bus = nullptr;
    const AbilityQueryService* abilities = nullptr;
    JudgementService* judgement = nullptr;

    ResolutionContext(Game* game,
                      Player* source_player,
                      ResolutionStack* stack,
                      CardMoveService* card_moves,
                      RuleService* rules);

    ResolutionContext withSource(Player* player) const;
    ResolutionContext withDamage(const DamageDescriptor& damage) const;
    ResolutionContext withoutAction() const;

    // Throws std::logic_error when the chain has no session.
    ResolutionSession& requireSession(const std::string& resolver_kind) const;
    ResolutionSession& ensureSession();

    bool canAskPlayers() const;
    // Throws std::logic_error without a choice callback.
    ChoiceResult ask(const ChoiceRequest& request) const;
    bool confirm(int seat, const std::string& reason) const;

    void log(const std::string& kind, const std::string& message, spdlog::level::level_enum level = spdlog::level::info,
             std::map<std::string, std::string> data = {}) const;

    template <typename T>
    void publish(T& event) {
        if (event_bus == nullptr) {
            return;
        }
        event.game = game;
        event.context = this;
        event_bus->publish(event);
    }
};
