// tests/judgement/test_judgement_service.cpp
#include "judgement/judgement_service.h"
#include "table_test.h"

#include <gtest/gtest.h>

#include <stdexcept>

class JudgementServiceTest : public TableTest {};

// Test for JudgementService::judge()
TEST_F(JudgementServiceTest, JudgeFlipsTopCardAndDiscardsIt) {
    buildDuel({"Peach", "Attack"});
    bool seen = false;
    engine->event_bus.subscribe<JudgementCompletedEvent>([&seen](JudgementCompletedEvent& event) {
        seen = true;
        EXPECT_TRUE(event.success);
        EXPECT_EQ(event.reason, "test");
    });

    JudgementResult result = engine->judgement.judge(*game, *seat(0), JudgementRequest{"test", judgement_rules::isRed()});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.card->name, "Peach");
    EXPECT_EQ(game->discard_pile.top(), result.card);
    EXPECT_TRUE(seat(0)->judgement.empty());
    EXPECT_EQ(game->draw_pile.size(), 1u);
    EXPECT_TRUE(seen);
}

// Test for BasicJudgementService::executeJudgement() and completeJudgement()
TEST_F(JudgementServiceTest, CardWaitsInJudgementZoneUntilCompleted) {
    buildDuel({"Attack"});
    JudgementResult result =
        engine->judgement.executeJudgement(*game, *seat(1), JudgementRequest{"test", judgement_rules::isNotHeart()});
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(seat(1)->judgement.contains(result.card));

    engine->judgement.completeJudgement(*game, *seat(1), result.card);
    EXPECT_TRUE(game->discard_pile.contains(result.card));
    EXPECT_THROW(engine->judgement.completeJudgement(*game, *seat(1), result.card), std::logic_error);
}

// Test for JudgementService::judge() errors
TEST_F(JudgementServiceTest, EmptyPileIsAFault) {
    buildDuel();
    EXPECT_THROW(engine->judgement.judge(*game, *seat(0), JudgementRequest{"test", judgement_rules::isRed()}),
                 std::runtime_error);
    EXPECT_THROW(engine->judgement.judge(*game, *seat(0), JudgementRequest{"test", nullptr}), std::invalid_argument);
}
