// action.cpp
#include "action.h"

#include "rules/card.h"

#include <algorithm>

bool ActionDescriptor::offersCard(int card_id) const {
    return std::any_of(card_candidates.begin(), card_candidates.end(),
                       [card_id](const Card* card) { return card->id == card_id; });
}
