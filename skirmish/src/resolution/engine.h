#pragma once

#include <memory>
#include <string>
#include <vector>

#include "abilities/ability_manager.h"
#include "agents/action.h"
#include "agents/choice.h"
#include "events/event_bus.h"
#include "judgement/judgement_service.h"
#include "logging/log_sink.h"
#include "resolution/resolution_stack.h"
#include "rules/rule_service.h"
#include "zones/card_move_service.h"

class Game;
class Player;

struct ActionOutcome {
    ResolutionResult result;
    std::vector<ResolutionRecord> history;

    std::vector<std::string> kinds() const;
};

// Wires the services of one game together and runs top-level actions on a fresh stack.
// Members are declared so the event bus outlives everything subscribed to it.
class Engine {
public:
    Game* game;
    EventBus event_bus;
    BasicCardMoveService card_moves;
    AbilityManager abilities;
    BasicRuleService rules;
    BasicJudgementService judgement;
    ChoiceCallback get_player_choice;
    LogSink* log_sink = nullptr;

    explicit Engine(Game* game, ChoiceCallback get_player_choice = nullptr, LogSink* log_sink = nullptr);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    ActionOutcome executeAction(Player* user, const ActionDescriptor& action, const ChoiceResult& choice);
    ActionOutcome runDrawPhase(Player* player);
    // Starts the seat's turn and runs it up to the play phase.
    ActionOutcome startTurn(int seat);
    ActionOutcome run(std::unique_ptr<Resolver> root, Player* source);

    // A context with every service attached and a fresh session.
    ResolutionContext makeContext(ResolutionStack* stack, Player* source);

private:
    ActionOutcome drainFrom(ResolutionStack& stack, std::unique_ptr<Resolver> root, const ResolutionContext& context);
};
