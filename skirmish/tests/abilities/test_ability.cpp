// tests/abilities/test_ability.cpp
#include "abilities/ability.h"
#include "abilities/ability_manager.h"
#include "abilities/ability_registry.h"
#include "table_test.h"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace {

// Re-publishes every heal it sees.
class EchoAbility : public Ability {
public:
    int handled = 0;

    std::string id() const override { return "echo"; }
    AbilityKind kind() const override { return AbilityKind::TRIGGER; }

protected:
    void subscribe(EventBus& event_bus) override {
        listen<HealedEvent>(event_bus, [this, &event_bus](HealedEvent& event) {
            ++handled;
            HealedEvent again;
            again.seat = event.seat;
            event_bus.publish(again);
        });
        listen<PlayerDiedEvent>(event_bus, [](PlayerDiedEvent&) {});
    }
};

}  // namespace

class AbilityTest : public TableTest {
protected:
    void SetUp() override { buildDuel(); }
};

// Test for Ability::attach() and Ability::detach()
TEST_F(AbilityTest, AttachSubscribesAndDetachUnsubscribes) {
    size_t before = engine->event_bus.subscriberCount();
    auto* echo = static_cast<EchoAbility*>(engine->abilities.add(seat(0), std::make_unique<EchoAbility>()));
    EXPECT_TRUE(echo->attached());
    EXPECT_EQ(echo->owner(), seat(0));
    EXPECT_EQ(echo->game(), game.get());
    EXPECT_EQ(echo->subscriptionCount(), 2u);
    EXPECT_EQ(engine->event_bus.subscriberCount(), before + 2);

    echo->detach();
    EXPECT_FALSE(echo->attached());
    EXPECT_EQ(echo->subscriptionCount(), 0u);
    EXPECT_EQ(engine->event_bus.subscriberCount(), before);

    echo->detach();
    EXPECT_EQ(engine->event_bus.subscriberCount(), before);
}

// Test for Ability::detach() on an ability that was never attached
TEST_F(AbilityTest, DetachWithoutAttachIsHarmless) {
    EchoAbility echo;
    EXPECT_NO_THROW(echo.detach());
    EXPECT_FALSE(echo.attached());
}

// Test for Ability::attach() on an attached ability
TEST_F(AbilityTest, AttachTwiceIsAFault) {
    EchoAbility echo;
    echo.attach(game.get(), seat(0), &engine->event_bus);
    EXPECT_THROW(echo.attach(game.get(), seat(1), &engine->event_bus), std::logic_error);
    EXPECT_THROW(EchoAbility().attach(game.get(), nullptr, &engine->event_bus), std::invalid_argument);
}

// Test for the reentry guard when a handler republishes its own event
TEST_F(AbilityTest, ReentrantEventIsSkipped) {
    auto* echo = static_cast<EchoAbility*>(engine->abilities.add(seat(0), std::make_unique<EchoAbility>()));
    HealedEvent event;
    EXPECT_NO_THROW(engine->event_bus.publish(event));
    EXPECT_EQ(echo->handled, 1);

    engine->event_bus.publish(event);
    EXPECT_EQ(echo->handled, 2);
}

// Test for Ability destruction while attached
TEST_F(AbilityTest, DestroyedAbilityLeavesNoSubscriptions) {
    size_t before = engine->event_bus.subscriberCount();
    {
        EchoAbility echo;
        echo.attach(game.get(), seat(0), &engine->event_bus);
        EXPECT_EQ(engine->event_bus.subscriberCount(), before + 2);
    }
    EXPECT_EQ(engine->event_bus.subscriberCount(), before);
}

// Test for AbilityManager::remove()
TEST_F(AbilityTest, ManagerRemoveDetaches) {
    Ability* echo = engine->abilities.add(seat(1), std::make_unique<EchoAbility>());
    EXPECT_EQ(engine->abilities.abilitiesOf(*seat(1)).size(), 1u);
    engine->abilities.remove(echo);
    EXPECT_TRUE(engine->abilities.abilitiesOf(*seat(1)).empty());
    EXPECT_THROW(engine->abilities.remove(echo), std::invalid_argument);
}

// Test for AbilityManager::activeAbilities() with a dead owner
TEST_F(AbilityTest, DeadOwnerAbilitiesAreInactive) {
    engine->abilities.add(seat(1), std::make_unique<EchoAbility>());
    EXPECT_EQ(engine->abilities.activeAbilities(*game, *seat(1)).size(), 1u);
    seat(1)->alive = false;
    EXPECT_TRUE(engine->abilities.activeAbilities(*game, *seat(1)).empty());
    EXPECT_EQ(engine->abilities.abilitiesOf(*seat(1)).size(), 1u);
}

// Test for registerAllAbilities()
TEST(AbilityRegistryTest, StandardCatalogIsRegistered) {
    AbilityRegistry& registry = AbilityRegistry::instance();
    for (const char* id : {"yingzi", "roar", "wushuang", "horsemanship", "jianxiong", "ganglie", "hujia", "longdan",
                           "zhuge_crossbow", "qinglong_blade", "kirin_bow", "defensive_horse", "offensive_horse",
                           "renwang_shield", "bagua_array"}) {
        EXPECT_TRUE(registry.contains(id)) << id;
    }
    EXPECT_EQ(registry.heroAbilities("cao_cao"), (std::vector<std::string>{"jianxiong", "hujia"}));
    EXPECT_TRUE(registry.heroAbilities("nobody").empty());
    EXPECT_EQ(registry.create("kirin_bow")->id(), "kirin_bow");
}

// Test for AbilityRegistry error handling
TEST(AbilityRegistryTest, RejectsDuplicatesAndUnknowns) {
    AbilityRegistry& registry = AbilityRegistry::instance();
    EXPECT_THROW(registry.registerAbility("yingzi", [] { return std::make_unique<EchoAbility>(); }), std::runtime_error);
    EXPECT_THROW(registry.create("missing"), std::runtime_error);
    EXPECT_THROW(registry.registerHero("ghost", {"missing"}), std::runtime_error);
    EXPECT_THROW(registry.registerAbility("empty", nullptr), std::invalid_argument);
}
