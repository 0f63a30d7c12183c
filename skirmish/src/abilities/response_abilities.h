#pragma once

#include <vector>

#include "rules/rule_context.h"

class Game;
class Player;
class ResolutionContext;
struct EvadeRequest;

// Lets other players answer a response on the owner's behalf.
class ResponseAssistanceAbility {
public:
    virtual ~ResponseAssistanceAbility() = default;
    virtual bool canProvideAssistance(const Game& game, const Player& owner, ResponseType type) const = 0;
    // Candidate helpers in the order they are asked.
    virtual std::vector<Player*> assistants(const Game& game, const Player& owner) const = 0;
};

// Satisfies a response without a card from hand.
class ResponseEnhancementAbility {
public:
    virtual ~ResponseEnhancementAbility() = default;
    virtual bool canProvideResponse(const Game& game, const Player& owner, const EvadeRequest& request) const = 0;
    // Returns true after resolving the request.
    virtual bool executeAlternativeResponse(ResolutionContext& context, Player& owner, EvadeRequest& request) = 0;
};
