// game.h
#pragma once

#include <vector>
#include <memory>
#include <map>
#include <string>

#include "rules/player.h"
#include "rules/card.h"
#include "zones/zone.h"

struct EngineConfig {
    int default_attack_damage = 1;
    int base_draw_count = 2;
    int base_attacks_per_turn = 1;
    int base_attack_distance = 1;
    int max_event_depth = 32;
};

enum class Phase {
    START,
    JUDGE,
    DRAW,
    PLAY,
    DISCARD,
    END
};

std::string toString(Phase phase);

class GameConfig {
public:
    std::vector<PlayerConfig> players;
    // Draw pile from top to bottom, by registered card name.
    std::vector<std::string> draw_pile;
    EngineConfig engine;

    GameConfig(const std::vector<PlayerConfig>& players,
               const std::vector<std::string>& draw_pile = {},
               const EngineConfig& engine = {})
        : players(players), draw_pile(draw_pile), engine(engine) {}
};

class Game {
public:
    EngineConfig config;
    std::vector<std::unique_ptr<Player>> players;

    Zone draw_pile;
    Zone discard_pile;

    int current_seat = 0;
    Phase phase = Phase::PLAY;
    // Counts turns begun; 0 before the first.
    int turn_number = 0;

    Game(const GameConfig& config);

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    // Lookups
    Player* player(int seat) const;
    Player* currentPlayer() const;
    Card* card(int id) const;
    std::vector<Player*> alivePlayers() const;
    // Living players in seat order, starting after the given seat.
    std::vector<Player*> seatOrderAfter(int seat) const;
    bool isGameOver() const;

    // Card ownership. The game owns every card dealt into it.
    Card* adoptCard(std::unique_ptr<Card> card);
    Card* createCard(const std::string& name);
    Card* dealToHand(Player* player, const std::string& name);

    void beginTurn(int seat);

private:
    std::map<int, std::unique_ptr<Card>> cards;
};
