// zone.cpp
#include "zone.h"
#include "rules/card.h"
#include "rules/player.h"

#include <algorithm>
#include <format>
#include <stdexcept>

std::string toString(ZoneKind kind) {
    switch (kind) {
        case ZoneKind::DRAW_PILE:
            return "DrawPile";
        case ZoneKind::DISCARD_PILE:
            return "DiscardPile";
        case ZoneKind::HAND:
            return "Hand";
        case ZoneKind::EQUIPMENT:
            return "Equipment";
        case ZoneKind::JUDGEMENT:
            return "Judgement";
    }
    throw std::invalid_argument("Unknown zone kind");
}

Zone::Zone(ZoneKind kind, Player* owner) : kind(kind), owner(owner) {}

void Zone::insert(Card* card, size_t index) {
    if (card == nullptr) {
        throw std::invalid_argument("Cannot insert a null card");
    }
    if (contains(card)) {
        throw std::logic_error(std::format("Card {} is already in this zone {}", card->toString(), id()));
    }
    index = std::min(index, cards.size());
    cards.insert(cards.begin() + static_cast<std::ptrdiff_t>(index), card);
    card->current_zone = this;
}

void Zone::add(Card* card) {
    insert(card, cards.size());
}

void Zone::remove(Card* card) {
    auto it = std::find(cards.begin(), cards.end(), card);
    if (it == cards.end()) {
        throw std::invalid_argument(std::format("Card {} is not in this zone {}.", card->toString(), id()));
    }
    cards.erase(it);
    if (card->current_zone == this) {
        card->current_zone = nullptr;
    }
}

bool Zone::contains(const Card* card) const {
    return std::find(cards.begin(), cards.end(), card) != cards.end();
}

Card* Zone::findById(int card_id) const {
    auto it = std::find_if(cards.begin(), cards.end(), [card_id](const Card* c) { return c->id == card_id; });
    return it == cards.end() ? nullptr : *it;
}

Card* Zone::top() const {
    return cards.empty() ? nullptr : cards.front();
}

size_t Zone::size() const {
    return cards.size();
}

bool Zone::empty() const {
    return cards.empty();
}

std::string Zone::id() const {
    if (owner) {
        return std::format("{}:{}", toString(kind), owner->seat);
    }
    return toString(kind);
}
