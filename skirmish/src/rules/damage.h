#pragma once

#include <optional>
#include <string>

enum class DamageKind {
    NORMAL,
    FIRE,
    THUNDER
};

std::string toString(DamageKind kind);

struct DamageDescriptor {
    // Unset for damage without a source player.
    std::optional<int> source_seat;
    int target_seat = 0;
    int amount = 0;
    DamageKind kind = DamageKind::NORMAL;
    std::string reason;
    std::optional<int> causing_card_id;
    bool preventable = true;
    std::optional<int> redirect_to_seat;
    bool triggers_dying = true;

    // Throws std::invalid_argument on negative amounts or seats.
    void validate() const;
    int effectiveTarget() const;
    std::string toString() const;
};
