#pragma once

#include <format>
#include <memory>
#include <optional>
#include <stdexcept>

#include "resolution/resolution_session.h"
#include "response/response_window.h"

class Card;
class Player;

// One requirement to evade, shared by every provider tried for it.
struct EvadeRequest {
    Player* defender = nullptr;
    Player* attacker = nullptr;
    SourceEvent source_event;
    ResponseType response_type = ResponseType::ATTACK_EVADE;
    int required_count = 1;

    bool resolved = false;
    std::optional<int> provided_by;
    Card* provided_card = nullptr;
    // Set by a provider that deferred; lower priority providers must not run.
    bool high_priority_activated = false;

    void resolve(int seat, Card* card) {
        if (resolved) {
            throw std::logic_error(std::format("Evade request already resolved by seat {}", provided_by.value_or(-1)));
        }
        resolved = true;
        provided_by = seat;
        provided_card = card;
    }
};

inline constexpr SessionKey<std::shared_ptr<EvadeRequest>> kEvadeRequest{"EvadeRequest"};
