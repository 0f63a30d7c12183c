// ability_registry.h
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "abilities/ability.h"

using AbilityFactory = std::function<std::unique_ptr<Ability>()>;

class AbilityRegistry {
public:
    static AbilityRegistry& instance();

    void registerAbility(const std::string& id, AbilityFactory factory);
    void registerHero(const std::string& hero, const std::vector<std::string>& ability_ids);

    std::unique_ptr<Ability> create(const std::string& id) const;
    bool contains(const std::string& id) const;
    std::vector<std::string> heroAbilities(const std::string& hero) const;

    // Deleting copy constructor and assignment operator to enforce singleton
    AbilityRegistry(const AbilityRegistry&) = delete;
    AbilityRegistry& operator=(const AbilityRegistry&) = delete;

private:
    AbilityRegistry() = default;
    std::map<std::string, AbilityFactory> factories;
    std::map<std::string, std::vector<std::string>> heroes;
};

void registerAllAbilities();
