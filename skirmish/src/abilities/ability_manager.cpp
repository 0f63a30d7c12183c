// ability_manager.cpp
#include "ability_manager.h"

#include "rules/game.h"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <spdlog/spdlog.h>

AbilityManager::AbilityManager(Game* game, EventBus* event_bus, const AbilityRegistry& registry)
    : game(game), event_bus(event_bus), registry(registry) {
    if (game == nullptr) {
        throw std::invalid_argument("AbilityManager needs a game");
    }
    if (event_bus) {
        equipment_subscription = event_bus->subscribe<EquipmentChangedEvent>(
            [this](EquipmentChangedEvent& event) { onEquipmentChanged(event); });
    }
}

AbilityManager::~AbilityManager() {
    clear();
    if (event_bus) {
        event_bus->unsubscribe(equipment_subscription);
    }
}

void AbilityManager::loadForPlayer(Player* player) {
    for (const std::string& id : registry.heroAbilities(player->hero)) {
        std::unique_ptr<Ability> ability = registry.create(id);
        if (ability->isLordAbility() && !player->is_lord) {
            spdlog::debug("Skipping lord ability {} for {}", id, player->toString());
            continue;
        }
        add(player, std::move(ability));
    }
}

void AbilityManager::loadAll() {
    for (const std::unique_ptr<Player>& player : game->players) {
        loadForPlayer(player.get());
    }
}

Ability* AbilityManager::add(Player* owner, std::unique_ptr<Ability> ability) {
    return attachEntry(owner, std::move(ability), std::nullopt);
}

Ability* AbilityManager::attachEntry(Player* owner, std::unique_ptr<Ability> ability, std::optional<int> equipment_card_id) {
    if (!ability || owner == nullptr) {
        throw std::invalid_argument("Cannot add a null ability or an ability without owner");
    }
    Ability* raw = ability.get();
    raw->attach(game, owner, event_bus);
    entries.push_back(Entry{owner, std::move(ability), equipment_card_id});
    spdlog::info("{} gains ability {}", owner->toString(), raw->id());
    return raw;
}

void AbilityManager::remove(Ability* ability) {
    auto it = std::find_if(entries.begin(), entries.end(), [ability](const Entry& e) { return e.ability.get() == ability; });
    if (it == entries.end()) {
        throw std::invalid_argument("Ability is not managed here");
    }
    it->ability->detach();
    spdlog::info("{} loses ability {}", it->owner->toString(), it->ability->id());
    entries.erase(it);
}

void AbilityManager::clear() {
    for (Entry& entry : entries) {
        entry.ability->detach();
    }
    entries.clear();
}

std::vector<Ability*> AbilityManager::abilitiesOf(const Player& player) const {
    std::vector<Ability*> result;
    for (const Entry& entry : entries) {
        if (entry.owner == &player) {
            result.push_back(entry.ability.get());
        }
    }
    return result;
}

Ability* AbilityManager::find(const Player& player, const std::string& id) const {
    for (const Entry& entry : entries) {
        if (entry.owner == &player && entry.ability->id() == id) {
            return entry.ability.get();
        }
    }
    return nullptr;
}

std::vector<Ability*> AbilityManager::activeAbilities(const Game& game, const Player& player) const {
    std::vector<Ability*> result;
    for (const Entry& entry : entries) {
        if (entry.owner == &player && entry.ability->isActive(game, player)) {
            result.push_back(entry.ability.get());
        }
    }
    return result;
}

void AbilityManager::onEquipmentChanged(EquipmentChangedEvent& event) {
    Player* owner = game->player(event.seat);
    if (owner == nullptr) {
        throw std::logic_error(std::format("Equipment changed for unknown seat {}", event.seat));
    }
    if (event.removed) {
        int removed_id = event.removed->id;
        auto it = std::find_if(entries.begin(), entries.end(),
                               [removed_id](const Entry& e) { return e.equipment_card_id == removed_id; });
        if (it != entries.end()) {
            remove(it->ability.get());
        }
    }
    if (event.equipped && event.equipped->granted_ability) {
        const std::string& id = *event.equipped->granted_ability;
        if (!registry.contains(id)) {
            spdlog::warn("Equipment {} grants unregistered ability {}", event.equipped->toString(), id);
            return;
        }
        attachEntry(owner, registry.create(id), event.equipped->id);
    }
}
