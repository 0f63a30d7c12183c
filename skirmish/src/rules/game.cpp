// game.cpp
#include "game.h"

#include "cardsets/card_registry.h"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <spdlog/spdlog.h>

std::string toString(Phase phase) {
    switch (phase) {
        case Phase::START:
            return "Start";
        case Phase::JUDGE:
            return "Judge";
        case Phase::DRAW:
            return "Draw";
        case Phase::PLAY:
            return "Play";
        case Phase::DISCARD:
            return "Discard";
        case Phase::END:
            return "End";
    }
    throw std::invalid_argument("Unknown phase");
}

Game::Game(const GameConfig& game_config)
    : config(game_config.engine),
      draw_pile(ZoneKind::DRAW_PILE),
      discard_pile(ZoneKind::DISCARD_PILE) {
    if (game_config.players.size() < 2) {
        throw std::invalid_argument("Game requires at least 2 players.");
    }
    if (config.max_event_depth <= 0) {
        throw std::invalid_argument("max_event_depth must be positive.");
    }

    int seat = 0;
    for (const PlayerConfig& player_config : game_config.players) {
        players.push_back(std::make_unique<Player>(seat++, player_config));
    }

    for (const std::unique_ptr<Player>& player : players) {
        const PlayerConfig& player_config = game_config.players[player->seat];
        for (const std::string& name : player_config.hand) {
            dealToHand(player.get(), name);
        }
    }

    for (const std::string& name : game_config.draw_pile) {
        draw_pile.add(createCard(name));
    }

    spdlog::info("Game created with {} players and {} cards in the draw pile", players.size(), draw_pile.size());
}

Player* Game::player(int seat) const {
    if (seat < 0 || seat >= static_cast<int>(players.size())) {
        return nullptr;
    }
    return players[seat].get();
}

Player* Game::currentPlayer() const {
    return player(current_seat);
}

Card* Game::card(int id) const {
    auto it = cards.find(id);
    return it == cards.end() ? nullptr : it->second.get();
}

std::vector<Player*> Game::alivePlayers() const {
    std::vector<Player*> alive;
    for (const std::unique_ptr<Player>& player : players) {
        if (player->alive) {
            alive.push_back(player.get());
        }
    }
    return alive;
}

std::vector<Player*> Game::seatOrderAfter(int seat) const {
    std::vector<Player*> order;
    int count = static_cast<int>(players.size());
    for (int offset = 1; offset < count; ++offset) {
        Player* next = players[(seat + offset) % count].get();
        if (next->alive) {
            order.push_back(next);
        }
    }
    return order;
}

bool Game::isGameOver() const {
    return std::count_if(players.begin(), players.end(), [](const std::unique_ptr<Player>& player) {
        return player->alive;
    }) < 2;
}

Card* Game::adoptCard(std::unique_ptr<Card> card) {
    if (!card) {
        throw std::invalid_argument("Cannot adopt a null card");
    }
    if (cards.contains(card->id)) {
        throw std::logic_error(std::format("Card {} already belongs to this game", card->toString()));
    }
    Card* raw = card.get();
    cards.emplace(raw->id, std::move(card));
    return raw;
}

Card* Game::createCard(const std::string& name) {
    return adoptCard(CardRegistry::instance().instantiate(name));
}

Card* Game::dealToHand(Player* player, const std::string& name) {
    Card* card = createCard(name);
    card->owner = player;
    player->hand.add(card);
    return card;
}

void Game::beginTurn(int seat) {
    Player* next = player(seat);
    if (next == nullptr) {
        throw std::invalid_argument(std::format("No player at seat {}", seat));
    }
    current_seat = seat;
    phase = Phase::START;
    turn_number += 1;
    next->resetTurnUsage();
    spdlog::info("Turn {} begins for {}", turn_number, next->toString());
}
