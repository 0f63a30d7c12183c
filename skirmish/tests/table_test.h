// tests/table_test.h
#pragma once

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "agents/agent.h"
#include "logging/log_sink.h"
#include "resolution/engine.h"
#include "rules/game.h"
#include "rules/rule_service.h"

// A player with no hero abilities unless one is named.
inline PlayerConfig seatConfig(const std::string& name,
                               const std::string& hero = "",
                               const std::string& faction = "qun",
                               int max_health = 4,
                               bool is_lord = false) {
    return PlayerConfig(name, hero, faction, max_health, is_lord);
}

// Game, engine and agents for resolution tests. Seats without a scripted agent pass.
class TableTest : public ::testing::Test {
protected:
    std::unique_ptr<Game> game;
    AgentTable agents;
    MemoryLogSink log;
    std::unique_ptr<Engine> engine;

    void build(const std::vector<PlayerConfig>& players,
               const std::vector<std::string>& draw_pile = {},
               const EngineConfig& config = {}) {
        game = std::make_unique<Game>(GameConfig(players, draw_pile, config));
        for (const std::unique_ptr<Player>& player : game->players) {
            if (agents.at(player->seat) == nullptr) {
                agents.seat(player->seat, std::make_unique<PassingAgent>());
            }
        }
        engine = std::make_unique<Engine>(game.get(), agents.callback(), &log);
    }

    void buildDuel(const std::vector<std::string>& draw_pile = {}) {
        build({seatConfig("Attacker"), seatConfig("Defender")}, draw_pile);
    }

    ScriptedAgent* script(int seat) {
        return static_cast<ScriptedAgent*>(agents.seat(seat, std::make_unique<ScriptedAgent>()));
    }

    Player* seat(int index) { return game->player(index); }

    Card* give(int seat_index, const std::string& name) { return game->dealToHand(seat(seat_index), name); }

    // Puts a card on top of the draw pile.
    Card* onTop(const std::string& name) {
        Card* card = game->createCard(name);
        game->draw_pile.insert(card, 0);
        return card;
    }

    ActionOutcome use(int user, const std::string& action_id, Card* card, std::vector<int> targets = {}) {
        bool requires_targets = !targets.empty();
        TargetConstraints constraints = requires_targets ? TargetConstraints{1, 1, TargetType::SINGLE_OTHER}
                                                         : TargetConstraints{0, 0, TargetType::SELF};
        ActionDescriptor action(action_id, "test.action", requires_targets, constraints, {card});
        return engine->executeAction(seat(user), action, ChoiceResult::forAction(user, {card->id}, targets));
    }

    ActionOutcome attack(int attacker, int defender, Card* card) {
        return use(attacker, BasicRuleService::kUseAttack, card, {defender});
    }

    ActionOutcome equip(int user, const std::string& name) {
        return use(user, BasicRuleService::kEquip, give(user, name));
    }
};
