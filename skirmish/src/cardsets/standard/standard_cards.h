// standard_cards.h
#pragma once

#include <string>

#include "rules/card.h"

Card basicCard(const std::string& name, Suit suit, int rank, CardSubType subtype);
Card trickCard(const std::string& name, Suit suit, int rank, CardSubType subtype);
Card equipmentCard(const std::string& name, Suit suit, int rank, CardSubType slot, const std::string& ability_id);

void registerStandardCards();
