// ability_registry.cpp
#include "abilities/ability_registry.h"
#include "cardsets/standard/standard_abilities.h"

#include <format>
#include <stdexcept>

AbilityRegistry& AbilityRegistry::instance() {
    static AbilityRegistry registry;
    return registry;
}

void AbilityRegistry::registerAbility(const std::string& id, AbilityFactory factory) {
    if (!factory) {
        throw std::invalid_argument(std::format("Ability {} needs a factory", id));
    }
    if (factories.contains(id)) {
        throw std::runtime_error(std::format("Ability already registered: {}", id));
    }
    factories.emplace(id, std::move(factory));
}

void AbilityRegistry::registerHero(const std::string& hero, const std::vector<std::string>& ability_ids) {
    if (heroes.contains(hero)) {
        throw std::runtime_error(std::format("Hero already registered: {}", hero));
    }
    for (const std::string& id : ability_ids) {
        if (!contains(id)) {
            throw std::runtime_error(std::format("Hero {} references unknown ability {}", hero, id));
        }
    }
    heroes.emplace(hero, ability_ids);
}

std::unique_ptr<Ability> AbilityRegistry::create(const std::string& id) const {
    auto it = factories.find(id);
    if (it == factories.end()) {
        throw std::runtime_error("Ability not found in registry: " + id);
    }
    return it->second();
}

bool AbilityRegistry::contains(const std::string& id) const {
    return factories.contains(id);
}

std::vector<std::string> AbilityRegistry::heroAbilities(const std::string& hero) const {
    auto it = heroes.find(hero);
    return it == heroes.end() ? std::vector<std::string>{} : it->second;
}

void registerAllAbilities() {
    registerStandardAbilities();
}
