// src/main.cpp
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "abilities/ability_registry.h"
#include "agents/agent.h"
#include "cardsets/card_registry.h"
#include "resolution/engine.h"
#include "rules/game.h"
#include "rules/rule_service.h"

int main() {
    auto logger = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);

    registerAllCards();
    registerAllAbilities();

    std::vector<PlayerConfig> players;
    players.emplace_back("Red Player", "lu_bu", "qun", 4, false,
                         std::vector<std::string>{"Attack", "Attack", "Zhuge Crossbow"});
    players.emplace_back("Blue Player", "cao_cao", "wei", 4, true, std::vector<std::string>{"Evade", "Evade", "Peach"});
    players.emplace_back("Green Player", "xiahou_dun", "wei", 4, false, std::vector<std::string>{"Evade"});

    std::vector<std::string> draw_pile = {"Attack", "Evade", "Peach", "Red Attack", "Bagua Array", "Evade"};

    Game game(GameConfig(players, draw_pile));

    AgentTable agents;
    agents.seat(0, std::make_unique<EagerAgent>());
    agents.seat(1, std::make_unique<EagerAgent>());
    agents.seat(2, std::make_unique<EagerAgent>());

    SpdlogLogSink sink;
    Engine engine(&game, agents.callback(), &sink);

    engine.startTurn(0);
    Player* attacker = game.currentPlayer();
    Player* defender = game.player(2);

    for (const ActionDescriptor& action : engine.rules.availableActions(RuleContext{&game, attacker})) {
        if (action.action_id != BasicRuleService::kUseAttack || action.card_candidates.empty()) {
            continue;
        }
        ChoiceResult choice = ChoiceResult::forAction(attacker->seat, {action.card_candidates.front()->id}, {defender->seat});
        ActionOutcome outcome = engine.executeAction(attacker, action, choice);
        std::string kinds;
        for (const std::string& kind : outcome.kinds()) {
            kinds += kinds.empty() ? kind : " -> " + kind;
        }
        spdlog::info("Attack resolved: {} [{}]", outcome.result.toString(), kinds);
        break;
    }

    for (Player* player : game.alivePlayers()) {
        spdlog::info("{}", player->toString());
    }

    spdlog::shutdown();
    return 0;
}
