// tests/resolution/test_attack_flow.cpp
#include "table_test.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using Kinds = std::vector<std::string>;

class AttackFlowTest : public TableTest {};

// Test for an attack the defender does not answer
TEST_F(AttackFlowTest, UnansweredAttackDealsDamage) {
    buildDuel();
    Card* card = give(0, "Attack");

    ActionOutcome outcome = attack(0, 1, card);
    EXPECT_TRUE(outcome.result.success);
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "attack", "response-window", "attack-outcome", "damage"}));
    EXPECT_EQ(seat(1)->health, 3);
    EXPECT_EQ(game->discard_pile.top(), card);
    EXPECT_EQ(seat(0)->usesThisTurn(CardSubType::ATTACK), 1);

    const LogEntry* applied = log.last("DamageApplied");
    ASSERT_NE(applied, nullptr);
    EXPECT_EQ(applied->data.at("amount"), "1");
    EXPECT_EQ(applied->data.at("reason"), "attack");
}

// Test for an attack answered with an evade
TEST_F(AttackFlowTest, EvadedAttackSkipsDamage) {
    buildDuel();
    Card* card = give(0, "Attack");
    Card* evade = give(1, "Evade");
    script(1)->thenCards({evade->id});

    ActionOutcome outcome = attack(0, 1, card);
    EXPECT_TRUE(outcome.result.success);
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "attack", "response-window", "attack-outcome"}));
    EXPECT_EQ(seat(1)->health, 4);
    EXPECT_EQ(log.count("AttackEvaded"), 1u);
}

// Test for the attack limit
TEST_F(AttackFlowTest, SecondAttackInTurnIsRejected) {
    buildDuel();
    attack(0, 1, give(0, "Attack"));
    Card* second = give(0, "Attack");

    ActionOutcome outcome = attack(0, 1, second);
    EXPECT_FALSE(outcome.result.success);
    EXPECT_EQ(outcome.result.error_code, ResolutionErrorCode::RULE_VALIDATION_FAILED);
    EXPECT_EQ(outcome.result.message_key, "rule.use.attackLimit");
    EXPECT_EQ(outcome.kinds(), Kinds{"use-card"});
    EXPECT_TRUE(seat(0)->hand.contains(second));
    EXPECT_EQ(seat(1)->health, 3);
}

// Test for the Zhuge Crossbow
TEST_F(AttackFlowTest, CrossbowAllowsRepeatedAttacks) {
    buildDuel();
    ASSERT_TRUE(equip(0, "Zhuge Crossbow").result.success);
    ASSERT_NE(engine->abilities.find(*seat(0), "zhuge_crossbow"), nullptr);

    EXPECT_TRUE(attack(0, 1, give(0, "Attack")).result.success);
    EXPECT_TRUE(attack(0, 1, give(0, "Attack")).result.success);
    EXPECT_TRUE(attack(0, 1, give(0, "Red Attack")).result.success);
    EXPECT_EQ(seat(1)->health, 1);
}

// Test for roar
TEST_F(AttackFlowTest, RoarAllowsRepeatedAttacks) {
    build({seatConfig("Zhang Fei", "zhang_fei", "shu"), seatConfig("Target")});
    EXPECT_TRUE(attack(0, 1, give(0, "Attack")).result.success);
    EXPECT_TRUE(attack(0, 1, give(0, "Attack")).result.success);
    EXPECT_EQ(seat(1)->health, 2);
}

// Test for usage counters across turns
TEST_F(AttackFlowTest, NewTurnResetsAttackCount) {
    buildDuel({"Evade", "Evade", "Evade", "Evade"});
    attack(0, 1, give(0, "Attack"));
    engine->startTurn(0);
    EXPECT_EQ(game->phase, Phase::PLAY);
    EXPECT_TRUE(attack(0, 1, give(0, "Attack")).result.success);
}

// Test for attack range with and without a weapon
TEST_F(AttackFlowTest, DistantTargetNeedsAWeapon) {
    build({seatConfig("A"), seatConfig("B"), seatConfig("C"), seatConfig("D")});
    ActionOutcome outcome = attack(0, 2, give(0, "Attack"));
    EXPECT_EQ(outcome.result.error_code, ResolutionErrorCode::RULE_VALIDATION_FAILED);
    EXPECT_EQ(outcome.result.message_key, "rule.use.outOfRange");

    ASSERT_TRUE(equip(0, "Qinglong Blade").result.success);
    EXPECT_TRUE(attack(0, 2, give(0, "Attack")).result.success);
    EXPECT_EQ(seat(2)->health, 3);
}

// Test for an attack descriptor chosen without a target
TEST_F(AttackFlowTest, AttackWithoutTargetIsRejected) {
    buildDuel();
    Card* card = give(0, "Attack");
    ActionDescriptor action(BasicRuleService::kUseAttack, "action.useAttack", true,
                            TargetConstraints{1, 1, TargetType::SINGLE_OTHER}, {card});

    ActionOutcome outcome = engine->executeAction(seat(0), action, ChoiceResult::forAction(0, {card->id}));
    EXPECT_EQ(outcome.result.error_code, ResolutionErrorCode::RULE_VALIDATION_FAILED);
    EXPECT_EQ(outcome.result.message_key, "rule.action.targetCount");
    EXPECT_TRUE(seat(0)->hand.contains(card));
}

// Test for use-card with a card outside the hand
TEST_F(AttackFlowTest, CardOutsideHandIsRejected) {
    buildDuel();
    Card* card = game->createCard("Attack");
    game->discard_pile.add(card);
    ActionOutcome outcome = attack(0, 1, card);
    EXPECT_EQ(outcome.result.error_code, ResolutionErrorCode::CARD_NOT_FOUND);
}

// Test for an attack without a choice callback
TEST_F(AttackFlowTest, AttackNeedsAChoiceCallback) {
    buildDuel();
    engine->get_player_choice = nullptr;
    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_EQ(outcome.result.error_code, ResolutionErrorCode::INVALID_STATE);
    EXPECT_EQ(outcome.result.message_key, "resolution.attack.choiceCallbackRequired");
    EXPECT_EQ(seat(1)->health, 4);
}

// Test for wushuang
TEST_F(AttackFlowTest, WushuangDemandsTwoEvades) {
    build({seatConfig("Lu Bu", "lu_bu"), seatConfig("Target")});
    Card* first = give(1, "Evade");
    Card* second = give(1, "Evade");
    script(1)->thenCards({first->id}).thenCards({second->id});

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_TRUE(outcome.result.success);
    EXPECT_EQ(seat(1)->health, 4);
    EXPECT_TRUE(seat(1)->hand.empty());
}

// Test for wushuang when only one evade is given
TEST_F(AttackFlowTest, WushuangShortfallStillDealsDamage) {
    build({seatConfig("Lu Bu", "lu_bu"), seatConfig("Target")});
    Card* evade = give(1, "Evade");
    script(1)->thenCards({evade->id});

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_FALSE(outcome.result.success);
    EXPECT_EQ(outcome.result.error_code, ResolutionErrorCode::INVALID_STATE);
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "attack", "response-window", "attack-outcome", "damage"}));
    EXPECT_EQ(seat(1)->health, 3);
    EXPECT_EQ(game->discard_pile.top(), evade);
}

// Test for the Renwang Shield
TEST_F(AttackFlowTest, RenwangShieldStopsBlackAttacks) {
    buildDuel();
    game->current_seat = 1;
    ASSERT_TRUE(equip(1, "Renwang Shield").result.success);
    game->current_seat = 0;

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_TRUE(outcome.result.success);
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "attack"}));
    EXPECT_EQ(seat(1)->health, 4);
    ASSERT_NE(log.last("CardEffectVetoed"), nullptr);
    EXPECT_EQ(log.last("CardEffectVetoed")->data.at("vetoedBy"), "renwang_shield");

    seat(0)->resetTurnUsage();
    EXPECT_TRUE(attack(0, 1, give(0, "Red Attack")).result.success);
    EXPECT_EQ(seat(1)->health, 3);
}

// Test for jianxiong
TEST_F(AttackFlowTest, JianxiongTakesTheAttackCard) {
    build({seatConfig("Attacker"), seatConfig("Cao Cao", "cao_cao", "wei")});
    script(1)->thenConfirm(true);
    Card* card = give(0, "Attack");

    EXPECT_TRUE(attack(0, 1, card).result.success);
    EXPECT_EQ(seat(1)->health, 3);
    EXPECT_TRUE(seat(1)->hand.contains(card));
    EXPECT_EQ(card->owner, seat(1));
    EXPECT_FALSE(game->discard_pile.contains(card));
}

// Test for jianxiong when the owner declines
TEST_F(AttackFlowTest, JianxiongCanBeDeclined) {
    build({seatConfig("Attacker"), seatConfig("Cao Cao", "cao_cao", "wei")});
    script(1)->thenConfirm(false);
    Card* card = give(0, "Attack");

    attack(0, 1, card);
    EXPECT_TRUE(game->discard_pile.contains(card));
}

// Test for ganglie against a source with an empty hand
TEST_F(AttackFlowTest, GanglieDamagesSourceWithoutCards) {
    build({seatConfig("Attacker"), seatConfig("Xiahou Dun", "xiahou_dun", "wei")}, {"Evade"});
    script(1)->thenConfirm(true);

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_TRUE(outcome.result.success);
    EXPECT_EQ(outcome.kinds(),
              (Kinds{"use-card", "attack", "response-window", "attack-outcome", "damage", "ganglie", "damage"}));
    EXPECT_EQ(seat(1)->health, 3);
    EXPECT_EQ(seat(0)->health, 3);
    EXPECT_TRUE(game->draw_pile.empty());
    EXPECT_TRUE(seat(1)->judgement.empty());
}

// Test for ganglie when the source discards two cards
TEST_F(AttackFlowTest, GanglieSourceMayDiscardInstead) {
    build({seatConfig("Attacker"), seatConfig("Xiahou Dun", "xiahou_dun", "wei")}, {"Evade"});
    script(1)->thenConfirm(true);
    Card* kept_a = give(0, "Peach");
    Card* kept_b = give(0, "Evade");
    script(0)->thenCards({kept_a->id, kept_b->id});

    ActionOutcome outcome = attack(0, 1, give(0, "Attack"));
    EXPECT_TRUE(outcome.result.success);
    EXPECT_EQ(seat(0)->health, 4);
    EXPECT_TRUE(seat(0)->hand.empty());
    EXPECT_EQ(log.count("AbilityCostPaid"), 1u);
}

// Test for ganglie with a heart judgement
TEST_F(AttackFlowTest, GanglieFailsOnHeartJudgement) {
    build({seatConfig("Attacker"), seatConfig("Xiahou Dun", "xiahou_dun", "wei")}, {"Peach"});
    script(1)->thenConfirm(true);

    attack(0, 1, give(0, "Attack"));
    EXPECT_EQ(seat(0)->health, 4);
    EXPECT_EQ(log.count("AbilityFizzled"), 1u);
}

// Test for Arrow Volley
TEST_F(AttackFlowTest, ArrowVolleyAsksInSeatOrder) {
    build({seatConfig("A"), seatConfig("B"), seatConfig("C")});
    Card* evade = give(1, "Evade");
    ScriptedAgent* first = script(1);
    first->thenCards({evade->id});
    Card* other_evade = give(2, "Evade");
    ScriptedAgent* second = script(2);
    second->thenPass();

    ActionOutcome outcome = use(0, BasicRuleService::kUseArrowVolley, give(0, "Arrow Volley"));
    EXPECT_TRUE(outcome.result.success);
    EXPECT_EQ(outcome.kinds(), (Kinds{"use-card", "arrow-volley", "response-window", "attack-outcome",
                                      "response-window", "attack-outcome", "damage"}));
    EXPECT_EQ(seat(1)->health, 4);
    EXPECT_EQ(seat(2)->health, 3);
    EXPECT_TRUE(seat(2)->hand.contains(other_evade));
    EXPECT_EQ(first->seen.size(), 1u);
    EXPECT_EQ(second->seen.size(), 1u);
}

// Test for Peach
TEST_F(AttackFlowTest, PeachHealsTheUser) {
    buildDuel();
    seat(0)->health = 2;
    EXPECT_TRUE(use(0, BasicRuleService::kUsePeach, give(0, "Peach")).result.success);
    EXPECT_EQ(seat(0)->health, 3);

    EXPECT_TRUE(use(0, BasicRuleService::kUsePeach, give(0, "Peach")).result.success);
    EXPECT_EQ(seat(0)->health, 4);
    EXPECT_EQ(use(0, BasicRuleService::kUsePeach, give(0, "Peach")).result.error_code,
              ResolutionErrorCode::RULE_VALIDATION_FAILED);
}

// Test for equipping over an occupied slot
TEST_F(AttackFlowTest, EquippingReplacesTheSameSlot) {
    build({seatConfig("A"), seatConfig("B"), seatConfig("C"), seatConfig("D"), seatConfig("E"), seatConfig("F")});
    ASSERT_TRUE(equip(0, "Qinglong Blade").result.success);
    Card* blade = seat(0)->equipped(CardSubType::WEAPON);
    ASSERT_NE(blade, nullptr);
    EXPECT_EQ(engine->rules.attackDistance(*game, *seat(0), *seat(3)), 3);

    ASSERT_TRUE(equip(0, "Kirin Bow").result.success);
    EXPECT_EQ(seat(0)->equipped(CardSubType::WEAPON)->name, "Kirin Bow");
    EXPECT_TRUE(game->discard_pile.contains(blade));
    EXPECT_EQ(engine->abilities.find(*seat(0), "qinglong_blade"), nullptr);
    EXPECT_NE(engine->abilities.find(*seat(0), "kirin_bow"), nullptr);
    EXPECT_EQ(engine->rules.attackDistance(*game, *seat(0), *seat(3)), 5);
}

// Test for use-card with a card the action does not offer
TEST_F(AttackFlowTest, CardOutsideTheActionIsRejected) {
    buildDuel();
    Card* offered = give(0, "Attack");
    Card* other = give(0, "Attack");
    ActionDescriptor action(BasicRuleService::kUseAttack, "action.useAttack", true,
                            TargetConstraints{1, 1, TargetType::SINGLE_OTHER}, {offered});

    ActionOutcome outcome = engine->executeAction(seat(0), action, ChoiceResult::forAction(0, {other->id}, {1}));
    EXPECT_EQ(outcome.result.error_code, ResolutionErrorCode::CARD_NOT_FOUND);
    EXPECT_EQ(outcome.result.message_key, "resolution.useCard.notACandidate");
    EXPECT_TRUE(seat(0)->hand.contains(other));
}

// Test for use-card when an attack names no target
TEST_F(AttackFlowTest, UntargetedAttackKeepsCardAndUse) {
    buildDuel();
    Card* card = give(0, "Attack");
    ActionDescriptor action(BasicRuleService::kUseAttack, "action.useAttack", false,
                            TargetConstraints{0, 0, TargetType::NONE}, {card});

    ActionOutcome outcome = engine->executeAction(seat(0), action, ChoiceResult::forAction(0, {card->id}));
    EXPECT_EQ(outcome.result.error_code, ResolutionErrorCode::RULE_VALIDATION_FAILED);
    EXPECT_EQ(outcome.result.message_key, "rule.action.targetCount");
    EXPECT_EQ(outcome.kinds(), std::vector<std::string>{"use-card"});
    EXPECT_TRUE(seat(0)->hand.contains(card));
    EXPECT_TRUE(game->discard_pile.empty());
    EXPECT_EQ(seat(0)->usesThisTurn(CardSubType::ATTACK), 0);
}

// Test for use-card when the action belongs to another card
TEST_F(AttackFlowTest, CardUnderWrongActionKeepsCardAndUse) {
    buildDuel();
    seat(0)->health = 3;
    Card* card = give(0, "Attack");

    ActionOutcome outcome = use(0, BasicRuleService::kUsePeach, card);
    EXPECT_EQ(outcome.result.error_code, ResolutionErrorCode::RULE_VALIDATION_FAILED);
    EXPECT_EQ(outcome.result.message_key, "rule.action.wrongAction");
    EXPECT_TRUE(seat(0)->hand.contains(card));
    EXPECT_EQ(seat(0)->usesThisTurn(CardSubType::ATTACK), 0);
    EXPECT_EQ(seat(0)->health, 3);

    Card* peach = give(0, "Peach");
    EXPECT_EQ(use(0, BasicRuleService::kUsePeach, peach, {1}).result.message_key, "rule.action.targetCount");
    EXPECT_TRUE(seat(0)->hand.contains(peach));
}

// Test for use-card with an evade
TEST_F(AttackFlowTest, EvadeIsNeverPlayedAsAnAction) {
    buildDuel();
    Card* evade = give(0, "Evade");
    ActionOutcome outcome = use(0, BasicRuleService::kEquip, evade);
    EXPECT_EQ(outcome.result.error_code, ResolutionErrorCode::RULE_VALIDATION_FAILED);
    EXPECT_EQ(outcome.result.message_key, "rule.use.evadeIsResponseOnly");
    EXPECT_TRUE(seat(0)->hand.contains(evade));
}
