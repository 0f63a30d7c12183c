// damage.cpp
#include "damage.h"

#include <format>
#include <stdexcept>

std::string toString(DamageKind kind) {
    switch (kind) {
        case DamageKind::NORMAL:
            return "Normal";
        case DamageKind::FIRE:
            return "Fire";
        case DamageKind::THUNDER:
            return "Thunder";
    }
    throw std::invalid_argument("Unknown damage kind");
}

void DamageDescriptor::validate() const {
    if (amount < 0) {
        throw std::invalid_argument(std::format("Damage amount must not be negative, got {}", amount));
    }
    if (target_seat < 0 || (source_seat && *source_seat < 0) || (redirect_to_seat && *redirect_to_seat < 0)) {
        throw std::invalid_argument(std::format("Damage seats must not be negative: {}", toString()));
    }
}

int DamageDescriptor::effectiveTarget() const {
    return redirect_to_seat.value_or(target_seat);
}

std::string DamageDescriptor::toString() const {
    return std::format("{{source: {}, target: {}, amount: {}, kind: {}, reason: {}}}",
                       source_seat ? std::to_string(*source_seat) : "none",
                       target_seat,
                       amount,
                       ::toString(kind),
                       reason);
}
