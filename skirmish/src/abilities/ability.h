#pragma once

#include <functional>
#include <set>
#include <string>
#include <typeindex>
#include <vector>

#include "abilities/ability_query_service.h"
#include "events/event_bus.h"
#include "rules/rule_modifier.h"

class Game;
class Player;

enum class AbilityKind {
    // Used on the owner's initiative.
    ACTIVE,
    // Reacts to events.
    TRIGGER,
    // Always on.
    LOCKED
};

// A hero- or equipment-granted capability. Rule opinions come through the RuleModifier hooks;
// reactions come through event subscriptions made in subscribe().
class Ability : public RuleModifier {
public:
    virtual ~Ability();

    Ability(const Ability&) = delete;
    Ability& operator=(const Ability&) = delete;

    virtual std::string id() const = 0;
    virtual AbilityKind kind() const = 0;
    virtual bool isLordAbility() const { return false; }
    virtual bool isActive(const Game& game, const Player& owner) const;

    void attach(Game* game, Player* owner, EventBus* event_bus);
    // Safe to call when never attached and to call repeatedly.
    void detach();

    bool attached() const;
    size_t subscriptionCount() const;
    Player* owner() const;
    Game* game() const;

protected:
    Ability() = default;

    virtual void subscribe(EventBus& event_bus) {}

    template <typename T>
    void listen(EventBus& event_bus, std::function<void(T&)> handler) {
        subscriptions.push_back(event_bus.subscribe<T>(
            [this, handler = std::move(handler)](T& event) {
                std::type_index type(typeid(T));
                if (handling.contains(type)) {
                    skippedReentry(typeid(T).name());
                    return;
                }
                HandlingScope scope(handling, type);
                handler(event);
            }));
    }

private:
    class HandlingScope {
    public:
        HandlingScope(std::set<std::type_index>& handling, std::type_index type) : handling(handling), type(type) {
            handling.insert(type);
        }
        ~HandlingScope() { handling.erase(type); }

    private:
        std::set<std::type_index>& handling;
        std::type_index type;
    };

    Game* attached_game = nullptr;
    Player* attached_owner = nullptr;
    EventBus* event_bus = nullptr;
    std::vector<SubscriptionId> subscriptions;
    // Event kinds this ability is currently reacting to.
    std::set<std::type_index> handling;

    void skippedReentry(const char* event_name) const;
};

// First active ability of the player that implements T, or nullptr.
template <typename T>
T* findActiveAbility(const AbilityQueryService* abilities, const Game& game, const Player& player) {
    if (abilities == nullptr) {
        return nullptr;
    }
    for (Ability* ability : abilities->activeAbilities(game, player)) {
        if (T* match = dynamic_cast<T*>(ability)) {
            return match;
        }
    }
    return nullptr;
}
