// rule_result.cpp
#include "rule_result.h"

#include <stdexcept>

std::string toString(RuleReason reason) {
    switch (reason) {
        case RuleReason::NONE:
            return "None";
        case RuleReason::PLAYER_DEAD:
            return "PlayerDead";
        case RuleReason::NOT_ACTIVE_PLAYER:
            return "NotActivePlayer";
        case RuleReason::PHASE_NOT_ALLOWED:
            return "PhaseNotAllowed";
        case RuleReason::CARD_NOT_OWNED:
            return "CardNotOwned";
        case RuleReason::RESPONSE_ONLY:
            return "ResponseOnly";
        case RuleReason::USAGE_LIMIT_REACHED:
            return "UsageLimitReached";
        case RuleReason::NO_LEGAL_TARGET:
            return "NoLegalTarget";
        case RuleReason::TARGET_OUT_OF_RANGE:
            return "TargetOutOfRange";
        case RuleReason::INVALID_TARGET:
            return "InvalidTarget";
        case RuleReason::INVALID_SELECTION:
            return "InvalidSelection";
        case RuleReason::ALREADY_FULL_HEALTH:
            return "AlreadyFullHealth";
        case RuleReason::RESPONSE_NOT_ALLOWED:
            return "ResponseNotAllowed";
        case RuleReason::VETOED:
            return "Vetoed";
    }
    throw std::invalid_argument("Unknown rule reason");
}
