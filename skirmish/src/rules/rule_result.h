#pragma once

#include <string>

enum class RuleReason {
    NONE,
    PLAYER_DEAD,
    NOT_ACTIVE_PLAYER,
    PHASE_NOT_ALLOWED,
    CARD_NOT_OWNED,
    RESPONSE_ONLY,
    USAGE_LIMIT_REACHED,
    NO_LEGAL_TARGET,
    TARGET_OUT_OF_RANGE,
    INVALID_TARGET,
    INVALID_SELECTION,
    ALREADY_FULL_HEALTH,
    RESPONSE_NOT_ALLOWED,
    VETOED
};

std::string toString(RuleReason reason);

struct RuleResult {
    bool allowed = true;
    RuleReason reason = RuleReason::NONE;
    std::string message_key;

    static RuleResult allow() { return RuleResult{}; }
    static RuleResult deny(RuleReason reason, const std::string& message_key) {
        return RuleResult{false, reason, message_key};
    }
};
