// FORESIGHT - Market Types Tests
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include <gtest/gtest.h>
#include "foresight/market/types.h"

#include <string>

using namespace foresight;
using namespace foresight::market;

// ============================================================================
// Error Categories
// ============================================================================

TEST(MarketErrorTest, CategoriesGroupErrors) {
    EXPECT_EQ(GetErrorCategory(MarketError::OK), ErrorCategory::None);
    EXPECT_EQ(GetErrorCategory(MarketError::OwnerOnly), ErrorCategory::Authorization);
    EXPECT_EQ(GetErrorCategory(MarketError::NotFound), ErrorCategory::NotFound);
    EXPECT_EQ(GetErrorCategory(MarketError::InsufficientStake), ErrorCategory::Validation);
    EXPECT_EQ(GetErrorCategory(MarketError::InvalidParameter), ErrorCategory::Validation);
    EXPECT_EQ(GetErrorCategory(MarketError::PredictionClosed), ErrorCategory::Phase);
    EXPECT_EQ(GetErrorCategory(MarketError::AlreadyPredicted), ErrorCategory::Phase);
    EXPECT_EQ(GetErrorCategory(MarketError::TransferFailed), ErrorCategory::External);
    EXPECT_EQ(GetErrorCategory(MarketError::StorageError), ErrorCategory::External);
}

TEST(MarketErrorTest, Names) {
    EXPECT_STREQ(MarketErrorToString(MarketError::PredictionActive), "PredictionActive");
    EXPECT_STREQ(ErrorCategoryToString(ErrorCategory::Phase), "Phase");
    EXPECT_STREQ(RoundPhaseToString(RoundPhase::AwaitingResolution), "AwaitingResolution");
}

// ============================================================================
// Round Phase
// ============================================================================

TEST(RoundPhaseTest, FollowsHeightUntilResolved) {
    Round round;
    round.startHeight = 100;
    round.endHeight = 110;
    round.targetHeight = 120;

    EXPECT_EQ(round.PhaseAt(100), RoundPhase::Open);
    EXPECT_EQ(round.PhaseAt(110), RoundPhase::Open);
    EXPECT_EQ(round.PhaseAt(111), RoundPhase::AwaitingResolution);
    EXPECT_EQ(round.PhaseAt(500), RoundPhase::AwaitingResolution);

    round.resolved = true;
    EXPECT_EQ(round.PhaseAt(105), RoundPhase::Resolved);
}
