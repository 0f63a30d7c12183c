#pragma once

#include <vector>

class Ability;
class Game;
class Player;

class AbilityQueryService {
public:
    virtual ~AbilityQueryService() = default;
    // Abilities currently in effect for the player, in registration order.
    virtual std::vector<Ability*> activeAbilities(const Game& game, const Player& player) const = 0;
};
