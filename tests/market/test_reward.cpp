// FORESIGHT - Reward Calculation Tests
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include <gtest/gtest.h>
#include "foresight/market/reward.h"

#include <stdexcept>

using namespace foresight;
using namespace foresight::market;

class RewardCalculatorTest : public ::testing::Test {
protected:
    RewardCalculator calc_{DEFAULT_FEE_PERCENTAGE};
};

// ============================================================================
// Gross Reward
// ============================================================================

TEST_F(RewardCalculatorTest, GrossRewardRoundScenario) {
    auto gross = calc_.CalculateGrossReward(96, 1000000, 1000000);
    ASSERT_TRUE(gross.has_value());
    EXPECT_EQ(*gross, 960000 + 9600);
}

TEST_F(RewardCalculatorTest, GrossRewardFloorsEachTerm) {
    // 333 * 50 / 100 = 166, 999 * 50 / 10000 = 4
    auto gross = calc_.CalculateGrossReward(50, 333, 999);
    ASSERT_TRUE(gross.has_value());
    EXPECT_EQ(*gross, 170);
}

TEST_F(RewardCalculatorTest, ZeroAccuracyPaysNothing) {
    EXPECT_EQ(calc_.CalculateGrossReward(0, 1000000, 5000000), std::optional<Amount>(0));
}

TEST_F(RewardCalculatorTest, RejectsOutOfRangeInputs) {
    EXPECT_FALSE(calc_.CalculateGrossReward(101, 1000, 1000).has_value());
    EXPECT_FALSE(calc_.CalculateGrossReward(50, -1, 1000).has_value());
    EXPECT_FALSE(calc_.CalculateGrossReward(50, 1000, MAX_MONEY + 1).has_value());
}

TEST_F(RewardCalculatorTest, LargestInputsStayInRange) {
    auto gross = calc_.CalculateGrossReward(100, MAX_MONEY, MAX_MONEY);
    // stake + pool / 100 exceeds MAX_MONEY
    EXPECT_FALSE(gross.has_value());

    gross = calc_.CalculateGrossReward(100, MAX_MONEY / 2, MAX_MONEY / 2);
    ASSERT_TRUE(gross.has_value());
    EXPECT_TRUE(MoneyRange(*gross));
}

// ============================================================================
// Protocol Fee
// ============================================================================

TEST_F(RewardCalculatorTest, ProtocolFeeFloors) {
    EXPECT_EQ(calc_.CalculateProtocolFee(969600), 48480);
    EXPECT_EQ(calc_.CalculateProtocolFee(19), 0);
    EXPECT_EQ(calc_.CalculateProtocolFee(20), 1);
    EXPECT_EQ(calc_.CalculateProtocolFee(0), 0);
}

TEST(RewardFeeTest, FeeBounds) {
    RewardCalculator none(0);
    EXPECT_EQ(none.CalculateProtocolFee(1000), 0);

    RewardCalculator all(100);
    EXPECT_EQ(all.GetFeePercentage(), 100u);
    EXPECT_EQ(all.CalculateProtocolFee(1000), 1000);

    EXPECT_THROW(RewardCalculator(101), std::invalid_argument);
}

// ============================================================================
// Breakdown
// ============================================================================

TEST_F(RewardCalculatorTest, BreakdownRoundScenario) {
    auto result = calc_.Calculate(96, 1000000, 1000000);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->accuracy, 96u);
    EXPECT_EQ(result->baseReward, 960000);
    EXPECT_EQ(result->poolBonus, 9600);
    EXPECT_EQ(result->grossReward, 969600);
    EXPECT_EQ(result->protocolFee, 48480);
    EXPECT_EQ(result->netReward, 921120);
    EXPECT_TRUE(result->isCorrect);
    EXPECT_TRUE(result->IsValid());
}

TEST_F(RewardCalculatorTest, BreakdownBelowThresholdIsIncorrect) {
    auto result = calc_.Calculate(49, 1000000, 3000000);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->isCorrect);
    EXPECT_GT(result->netReward, 0);
    EXPECT_TRUE(result->IsValid());
}

TEST(CorrectPredictionTest, Threshold) {
    EXPECT_FALSE(IsCorrectPrediction(0));
    EXPECT_FALSE(IsCorrectPrediction(49));
    EXPECT_TRUE(IsCorrectPrediction(50));
    EXPECT_TRUE(IsCorrectPrediction(100));
}
