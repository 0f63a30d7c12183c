#pragma once

#include <string>

enum class ResolutionErrorCode {
    NONE,
    INVALID_TARGET,
    CARD_NOT_FOUND,
    TARGET_NOT_ALIVE,
    INVALID_STATE,
    RULE_VALIDATION_FAILED
};

std::string toString(ResolutionErrorCode code);

// Expected, recoverable outcome of one resolver. Structural faults throw instead.
class ResolutionResult {
public:
    bool success;
    ResolutionErrorCode error_code;
    std::string message_key;

    static const ResolutionResult& ok();
    static ResolutionResult failure(ResolutionErrorCode code, const std::string& message_key = "");

    std::string toString() const;

private:
    ResolutionResult(bool success, ResolutionErrorCode error_code, const std::string& message_key)
        : success(success), error_code(error_code), message_key(message_key) {}
};
