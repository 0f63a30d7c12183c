// resolution_result.cpp
#include "resolution_result.h"

#include <format>
#include <stdexcept>

std::string toString(ResolutionErrorCode code) {
    switch (code) {
        case ResolutionErrorCode::NONE:
            return "None";
        case ResolutionErrorCode::INVALID_TARGET:
            return "InvalidTarget";
        case ResolutionErrorCode::CARD_NOT_FOUND:
            return "CardNotFound";
        case ResolutionErrorCode::TARGET_NOT_ALIVE:
            return "TargetNotAlive";
        case ResolutionErrorCode::INVALID_STATE:
            return "InvalidState";
        case ResolutionErrorCode::RULE_VALIDATION_FAILED:
            return "RuleValidationFailed";
    }
    throw std::invalid_argument("Unknown resolution error code");
}

const ResolutionResult& ResolutionResult::ok() {
    static const ResolutionResult success(true, ResolutionErrorCode::NONE, "");
    return success;
}

ResolutionResult ResolutionResult::failure(ResolutionErrorCode code, const std::string& message_key) {
    if (code == ResolutionErrorCode::NONE) {
        throw std::invalid_argument("A failure needs an error code");
    }
    return ResolutionResult(false, code, message_key);
}

std::string ResolutionResult::toString() const {
    if (success) {
        return "success";
    }
    return std::format("failure({}, {})", ::toString(error_code), message_key);
}
