// card_registry.cpp
#include "cardsets/card_registry.h"
#include "cardsets/standard/standard_cards.h"

#include <stdexcept>
#include <format>

CardRegistry& CardRegistry::instance() {
    static CardRegistry registry;
    return registry;
}

void CardRegistry::registerCard(const std::string& name, const Card& card) {
    if (card_map.find(name) != card_map.end()) {
        throw std::runtime_error(std::format("Card already registered: {}", name));
    }
    card_map.insert({name, std::make_unique<Card>(card)});
}

std::unique_ptr<Card> CardRegistry::instantiate(const std::string& name) const {
    auto it = card_map.find(name);
    if (it != card_map.end()) {
        // Create a new Card instance based on the stored card
        return std::make_unique<Card>(*it->second);
    } else {
        throw std::runtime_error("Card not found in registry: " + name);
    }
}

bool CardRegistry::contains(const std::string& name) const {
    return card_map.contains(name);
}

std::vector<std::string> CardRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& [name, card] : card_map) {
        result.push_back(name);
    }
    return result;
}

void registerAllCards() {
    registerStandardCards();
}
