// engine.cpp
#include "engine.h"

#include "resolution/card_resolvers.h"
#include "resolution/draw_phase_resolver.h"
#include "rules/game.h"

#include <format>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

namespace {

int eventDepthFor(const Game* game) {
    if (game == nullptr) {
        throw std::invalid_argument("Engine needs a game");
    }
    return game->config.max_event_depth;
}

}  // namespace

std::vector<std::string> ActionOutcome::kinds() const {
    std::vector<std::string> out;
    for (const ResolutionRecord& record : history) {
        out.push_back(record.kind);
    }
    return out;
}

Engine::Engine(Game* game, ChoiceCallback get_player_choice, LogSink* log_sink)
    : game(game),
      event_bus(eventDepthFor(game)),
      card_moves(game, &event_bus),
      abilities(game, &event_bus),
      rules(&abilities),
      judgement(&card_moves, &event_bus),
      get_player_choice(std::move(get_player_choice)),
      log_sink(log_sink) {
    abilities.loadAll();
}

ResolutionContext Engine::makeContext(ResolutionStack* stack, Player* source) {
    ResolutionContext context(game, source, stack, &card_moves, &rules);
    context.log_sink = log_sink;
    context.get_player_choice = get_player_choice;
    context.session = std::make_shared<ResolutionSession>();
    context.event_bus = &event_bus;
    context.abilities = &abilities;
    context.judgement = &judgement;
    return context;
}

ActionOutcome Engine::executeAction(Player* user, const ActionDescriptor& action, const ChoiceResult& choice) {
    if (user == nullptr) {
        throw std::invalid_argument("executeAction needs a player");
    }
    ResolutionStack stack;
    ResolutionContext context = makeContext(&stack, user);
    context.action = action;
    context.choice = choice;
    spdlog::debug("{} executes {}", user->toString(), action.action_id);
    return drainFrom(stack, std::make_unique<UseCardResolver>(), context);
}

ActionOutcome Engine::runDrawPhase(Player* player) {
    return run(std::make_unique<DrawPhaseResolver>(), player);
}

ActionOutcome Engine::startTurn(int seat) {
    game->beginTurn(seat);
    game->phase = Phase::DRAW;
    ActionOutcome outcome = runDrawPhase(game->currentPlayer());
    game->phase = Phase::PLAY;
    return outcome;
}

ActionOutcome Engine::run(std::unique_ptr<Resolver> root, Player* source) {
    ResolutionStack stack;
    return drainFrom(stack, std::move(root), makeContext(&stack, source));
}

ActionOutcome Engine::drainFrom(ResolutionStack& stack,
                                std::unique_ptr<Resolver> root,
                                const ResolutionContext& context) {
    stack.push(std::move(root), context);
    ResolutionResult result = stack.drain();
    if (!result.success) {
        spdlog::debug("Action finished with {}", result.toString());
    }
    return ActionOutcome{result, stack.history()};
}
