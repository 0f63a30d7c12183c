// rule_context.cpp
#include "rule_context.h"

#include <stdexcept>

std::string toString(ResponseType type) {
    switch (type) {
        case ResponseType::ATTACK_EVADE:
            return "AttackEvade";
        case ResponseType::VOLLEY_EVADE:
            return "VolleyEvade";
        case ResponseType::PEACH_FOR_DYING:
            return "PeachForDying";
    }
    throw std::invalid_argument("Unknown response type");
}

CardSubType expectedResponseCard(ResponseType type) {
    switch (type) {
        case ResponseType::ATTACK_EVADE:
        case ResponseType::VOLLEY_EVADE:
            return CardSubType::EVADE;
        case ResponseType::PEACH_FOR_DYING:
            return CardSubType::PEACH;
    }
    throw std::invalid_argument("Unknown response type");
}
