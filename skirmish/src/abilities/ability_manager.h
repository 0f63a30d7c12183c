#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "abilities/ability.h"
#include "abilities/ability_query_service.h"
#include "abilities/ability_registry.h"
#include "events/event_bus.h"

class Game;
class Player;

// Owns every ability in play. Hero abilities are loaded per player; equipment abilities follow
// EquipmentChangedEvent. The event bus must outlive the manager.
class AbilityManager : public AbilityQueryService {
public:
    AbilityManager(Game* game, EventBus* event_bus, const AbilityRegistry& registry = AbilityRegistry::instance());
    ~AbilityManager() override;

    AbilityManager(const AbilityManager&) = delete;
    AbilityManager& operator=(const AbilityManager&) = delete;

    void loadForPlayer(Player* player);
    void loadAll();

    Ability* add(Player* owner, std::unique_ptr<Ability> ability);
    void remove(Ability* ability);
    void clear();

    std::vector<Ability*> abilitiesOf(const Player& player) const;
    Ability* find(const Player& player, const std::string& id) const;
    std::vector<Ability*> activeAbilities(const Game& game, const Player& player) const override;

private:
    struct Entry {
        Player* owner;
        std::unique_ptr<Ability> ability;
        std::optional<int> equipment_card_id;
    };

    Game* game;
    EventBus* event_bus;
    const AbilityRegistry& registry;
    std::vector<Entry> entries;
    SubscriptionId equipment_subscription = 0;

    Ability* attachEntry(Player* owner, std::unique_ptr<Ability> ability, std::optional<int> equipment_card_id);
    void onEquipmentChanged(EquipmentChangedEvent& event);
};
