#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rules/card.h"

class Game;
class Player;

enum class ResponseType {
    ATTACK_EVADE,
    VOLLEY_EVADE,
    PEACH_FOR_DYING
};

std::string toString(ResponseType type);
// The card subtype that satisfies a response of this type.
CardSubType expectedResponseCard(ResponseType type);

struct RuleContext {
    const Game* game = nullptr;
    const Player* player = nullptr;
};

struct CardUsageContext {
    const Game* game = nullptr;
    const Player* user = nullptr;
    const Card* card = nullptr;
    std::vector<const Player*> targets;
};

struct ResponseContext {
    const Game* game = nullptr;
    const Player* responder = nullptr;
    ResponseType response_type = ResponseType::ATTACK_EVADE;
    const Card* source_card = nullptr;
    std::optional<int> source_seat;
};
