// tests/response/test_evade_providers.cpp
#include "abilities/ability_manager.h"
#include "abilities/response_abilities.h"
#include "resolution/resolution_stack.h"
#include "response/evade_providers.h"
#include "table_test.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using Kinds = std::vector<std::string>;

namespace {

enum class ProviderAction { DECLINE, DEFER, RESOLVE };

class RecordingProvider : public EvadeProvider {
public:
    RecordingProvider(std::string label, int rank, ProviderAction action, std::vector<std::string>* calls)
        : label(std::move(label)), rank(rank), action(action), calls(calls) {}

    int priority() const override { return rank; }
    std::string name() const override { return label; }

    bool tryProvide(ResolutionContext&, EvadeRequest& request) override {
        calls->push_back(label);
        switch (action) {
            case ProviderAction::DECLINE:
                return false;
            case ProviderAction::DEFER:
                request.high_priority_activated = true;
                return false;
            case ProviderAction::RESOLVE:
                request.resolve(request.defender->seat, nullptr);
                return true;
        }
        return false;
    }

private:
    std::string label;
    int rank;
    ProviderAction action;
    std::vector<std::string>* calls;
};

}  // namespace

class EvadeProviderChainTest : public TableTest {
protected:
    std::vector<std::string> calls;

    std::shared_ptr<EvadeRequest> requestAgainst(int defender) {
        auto request = std::make_shared<EvadeRequest>();
        request->defender = seat(defender);
        request->attacker = seat(0);
        request->source_event = SourceEvent{"attack", 0, defender, nullptr};
        return request;
    }

    std::unique_ptr<EvadeProvider> provider(const std::string& label, int rank, ProviderAction action) {
        return std::make_unique<RecordingProvider>(label, rank, action, &calls);
    }

    ResolutionContext runChain(std::shared_ptr<EvadeRequest> request,
                               std::vector<std::unique_ptr<EvadeProvider>> providers) {
        ResolutionStack stack;
        ResolutionContext context = engine->makeContext(&stack, seat(0));
        context.session->set(kLastResponseResult, ResponseWindowResult{ResponseWindowState::RESPONSE_SUCCESS});
        stack.push(std::make_unique<EvadeProviderChainResolver>(std::move(request), std::move(providers)), context);
        EXPECT_TRUE(stack.drain().success);
        return context;
    }
};

// Test for EvadeProviderChainResolver provider order
TEST_F(EvadeProviderChainTest, TriesProvidersInPriorityOrder) {
    buildDuel();
    std::vector<std::unique_ptr<EvadeProvider>> providers;
    providers.push_back(provider("late", 2, ProviderAction::DECLINE));
    providers.push_back(provider("first", 0, ProviderAction::DECLINE));
    providers.push_back(provider("tied", 0, ProviderAction::DECLINE));

    ResolutionContext context = runChain(requestAgainst(1), std::move(providers));
    EXPECT_EQ(calls, (std::vector<std::string>{"first", "tied", "late"}));

    // A chain that resolves nothing must not inherit an older window result.
    const ResponseWindowResult* result = context.session->find(kLastResponseResult);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->state, ResponseWindowState::NO_RESPONSE);
}

// Test for EvadeProviderChainResolver after a provider defers
TEST_F(EvadeProviderChainTest, DeferringProviderLocksOutTheRest) {
    buildDuel();
    std::vector<std::unique_ptr<EvadeProvider>> providers;
    providers.push_back(provider("high", 0, ProviderAction::DEFER));
    providers.push_back(provider("low", 1, ProviderAction::RESOLVE));

    auto request = requestAgainst(1);
    runChain(request, std::move(providers));
    EXPECT_EQ(calls, std::vector<std::string>{"high"});
    EXPECT_FALSE(request->resolved);
}

// Test for EvadeProviderChainResolver when a provider resolves at once
TEST_F(EvadeProviderChainTest, SynchronousResolutionRecordsSuccess) {
    buildDuel();
    std::vector<std::unique_ptr<EvadeProvider>> providers;
    providers.push_back(provider("resolver", 0, ProviderAction::RESOLVE));
    providers.push_back(provider("unused", 1, ProviderAction::RESOLVE));

    auto request = requestAgainst(1);
    ResolutionContext context = runChain(request, std::move(providers));
    EXPECT_EQ(calls, std::vector<std::string>{"resolver"});
    EXPECT_TRUE(request->resolved);
    EXPECT_EQ(request->provided_by.value_or(-1), 1);

    const ResponseWindowResult* result = context.session->find(kLastResponseResult);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->state, ResponseWindowState::RESPONSE_SUCCESS);
    EXPECT_TRUE(context.session->contains(kEvadeRequest));
}

// Test for EvadeProviderChainResolver with a resolved request
TEST_F(EvadeProviderChainTest, AlreadyResolvedRequestSkipsEveryProvider) {
    buildDuel();
    std::vector<std::unique_ptr<EvadeProvider>> providers;
    providers.push_back(provider("any", 0, ProviderAction::RESOLVE));

    auto request = requestAgainst(1);
    request->resolve(1, nullptr);
    runChain(request, std::move(providers));
    EXPECT_TRUE(calls.empty());
}

// Test for EvadeProviderChainResolver without a session
TEST_F(EvadeProviderChainTest, ChainWithoutSessionIsAFault) {
    buildDuel();
    ResolutionStack stack;
    ResolutionContext context = engine->makeContext(&stack, seat(0));
    context.session.reset();
    stack.push(std::make_unique<EvadeProviderChainResolver>(requestAgainst(1), standardEvadeProviders()), context);
    EXPECT_THROW(stack.drain(), std::logic_error);
}

// Test for EvadeRequest::resolve()
TEST(EvadeRequestTest, ResolvesOnlyOnce) {
    EvadeRequest request;
    request.resolve(2, nullptr);
    EXPECT_THROW(request.resolve(3, nullptr), std::logic_error);
    EXPECT_EQ(request.provided_by.value_or(-1), 2);
}

class LordAssistanceTest : public TableTest {
protected:
    void SetUp() override {
        build({seatConfig("Attacker"), seatConfig("Cao Cao", "cao_cao", "wei", 4, true),
               seatConfig("Wei Ally", "", "wei"), seatConfig("Shu Bystander", "", "shu")});
    }
};

// Test for hujia when an ally evades
TEST_F(LordAssistanceTest, AllyEvadesForTheLord) {
    ScriptedAgent* lord = script(1);
    lord->thenConfirm(true).thenConfirm(false);
    Card* evade = give(2, "Evade");
    script(2)->thenConfirm(true).thenCards({evade->id});

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_TRUE(outcome.result.success);
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "attack", "evade-provider-chain", "assistance", "response-window",
                                      "assistance-outcome", "attack-outcome"}));
    EXPECT_EQ(seat(1)->health, 4);
    EXPECT_EQ(game->discard_pile.top(), evade);
    EXPECT_EQ(lord->seen.front().reason, "assistance.request");
}

// Test for hujia when no ally volunteers
TEST_F(LordAssistanceTest, LordAnswersAloneWhenNoAllyVolunteers) {
    Card* evade = give(1, "Evade");
    script(1)->thenConfirm(true).thenCards({evade->id});
    give(2, "Evade");
    script(2)->thenConfirm(false);

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_EQ(outcome.kinds(),
              (Kinds{"use-card", "attack", "evade-provider-chain", "assistance", "response-window", "attack-outcome"}));
    EXPECT_EQ(seat(1)->health, 4);
    EXPECT_EQ(seat(2)->hand.size(), 1u);
}

// Test for hujia when the volunteer has no evade
TEST_F(LordAssistanceTest, FailedAssistanceFallsBackToTheLord) {
    script(1)->thenConfirm(true).thenConfirm(false);
    script(2)->thenConfirm(true);

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "attack", "evade-provider-chain", "assistance", "response-window",
                                      "assistance-outcome", "response-window", "attack-outcome", "damage"}));
    EXPECT_EQ(seat(1)->health, 3);
}

// Test for hujia when the lord declines
TEST_F(LordAssistanceTest, DecliningAssistanceUsesOwnWindow) {
    script(1)->thenConfirm(false);
    ScriptedAgent* ally = script(2);

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "attack", "evade-provider-chain", "response-window",
                                      "attack-outcome", "damage"}));
    EXPECT_TRUE(ally->seen.empty());
}

// Test for HujiaAbility::assistants()
TEST_F(LordAssistanceTest, HelpersAreLivingWeiInSeatOrder) {
    Ability* hujia = engine->abilities.find(*seat(1), "hujia");
    ASSERT_NE(hujia, nullptr);
    auto* assistance = dynamic_cast<ResponseAssistanceAbility*>(hujia);
    ASSERT_NE(assistance, nullptr);
    EXPECT_EQ(assistance->assistants(*game, *seat(1)), std::vector<Player*>{seat(2)});

    seat(2)->alive = false;
    EXPECT_TRUE(assistance->assistants(*game, *seat(1)).empty());
}

// Test for hujia answering attacks only
TEST_F(LordAssistanceTest, AssistanceCoversAttacksOnly) {
    auto* assistance = dynamic_cast<ResponseAssistanceAbility*>(engine->abilities.find(*seat(1), "hujia"));
    ASSERT_NE(assistance, nullptr);
    EXPECT_TRUE(assistance->canProvideAssistance(*game, *seat(1), ResponseType::ATTACK_EVADE));
    EXPECT_FALSE(assistance->canProvideAssistance(*game, *seat(1), ResponseType::VOLLEY_EVADE));
    EXPECT_FALSE(assistance->canProvideAssistance(*game, *seat(1), ResponseType::PEACH_FOR_DYING));
}

// Test for lord abilities on a non-lord hero
TEST(HujiaLoadingTest, NonLordDoesNotGetLordAbility) {
    Game game(GameConfig({seatConfig("A"), seatConfig("Cao Cao", "cao_cao", "wei")}));
    EventBus bus;
    AbilityManager manager(&game, &bus);
    manager.loadAll();
    EXPECT_EQ(manager.find(*game.player(1), "hujia"), nullptr);
    EXPECT_NE(manager.find(*game.player(1), "jianxiong"), nullptr);
}

class BaguaArrayTest : public TableTest {
protected:
    void equipBagua() {
        game->current_seat = 1;
        ASSERT_TRUE(equip(1, "Bagua Array").result.success);
        game->current_seat = 0;
    }
};

// Test for the Bagua Array with a red judgement
TEST_F(BaguaArrayTest, RedJudgementEvades) {
    buildDuel();
    equipBagua();
    onTop("Peach");
    script(1)->thenConfirm(true);

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_TRUE(outcome.result.success);
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "attack", "evade-provider-chain", "attack-outcome"}));
    EXPECT_EQ(seat(1)->health, 4);
    EXPECT_EQ(game->discard_pile.top()->name, "Peach");
    EXPECT_TRUE(seat(1)->judgement.empty());
}

// Test for the Bagua Array with a black judgement
TEST_F(BaguaArrayTest, BlackJudgementFallsBackToHand) {
    buildDuel();
    equipBagua();
    onTop("Attack");
    Card* evade = give(1, "Evade");
    script(1)->thenConfirm(true).thenCards({evade->id});

    ActionOutcome outcome = attack(0, 1, give(0, "Red Attack"));
    EXPECT_EQ(outcome.kinds(),
              (Kinds{"use-card", "attack", "evade-provider-chain", "response-window", "attack-outcome"}));
    EXPECT_EQ(seat(1)->health, 4);
    EXPECT_EQ(game->discard_pile.top(), evade);
}

// Test for the Bagua Array against wushuang
TEST_F(BaguaArrayTest, NotOfferedWhenTwoEvadesAreRequired) {
    build({seatConfig("Lu Bu", "lu_bu"), seatConfig("Target")});
    equipBagua();
    onTop("Peach");
    ScriptedAgent* defender = script(1);

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "attack", "response-window", "attack-outcome", "damage"}));
    EXPECT_TRUE(defender->seen.empty());
    EXPECT_EQ(game->draw_pile.size(), 1u);
}

// Test for the array staying out of arrow volleys
TEST_F(BaguaArrayTest, ArrowVolleyUsesPlainWindows) {
    buildDuel();
    equipBagua();
    onTop("Peach");
    ScriptedAgent* defender = script(1);

    auto* enhancement = dynamic_cast<ResponseEnhancementAbility*>(engine->abilities.find(*seat(1), "bagua_array"));
    ASSERT_NE(enhancement, nullptr);
    EvadeRequest volley;
    volley.defender = seat(1);
    volley.response_type = ResponseType::VOLLEY_EVADE;
    EXPECT_FALSE(enhancement->canProvideResponse(*game, *seat(1), volley));

    ActionOutcome outcome = use(0, BasicRuleService::kUseArrowVolley, give(0, "Arrow Volley"));
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "arrow-volley", "response-window", "attack-outcome", "damage"}));
    EXPECT_TRUE(defender->seen.empty());
    EXPECT_EQ(game->draw_pile.size(), 1u);
    EXPECT_EQ(seat(1)->health, 3);
}
