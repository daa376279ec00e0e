// FORESIGHT - Reputation Tests
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include <gtest/gtest.h>
#include "foresight/market/reputation.h"
#include "foresight/market/store.h"

using namespace foresight;
using namespace foresight::market;

namespace {

Principal MakePrincipal(uint8_t tag) {
    Principal p;
    p[0] = tag;
    p[19] = tag;
    return p;
}

} // namespace

// ============================================================================
// ApplyOutcome
// ============================================================================

TEST(ReputationTest, DefaultRecord) {
    Reputation rep;
    EXPECT_EQ(rep.totalPredictions, 0u);
    EXPECT_EQ(rep.correctPredictions, 0u);
    EXPECT_EQ(rep.totalEarnings, 0);
    EXPECT_EQ(rep.reputationScore, DEFAULT_REPUTATION_SCORE);
}

TEST(ReputationTest, FirstCorrectClaim) {
    Reputation rep = ApplyOutcome(Reputation(), true, 921120);
    EXPECT_EQ(rep.totalPredictions, 1u);
    EXPECT_EQ(rep.correctPredictions, 1u);
    EXPECT_EQ(rep.totalEarnings, 921120);
    EXPECT_EQ(rep.reputationScore, 100u);
}

TEST(ReputationTest, FirstIncorrectClaimDropsToZero) {
    Reputation rep = ApplyOutcome(Reputation(), false, 1000);
    EXPECT_EQ(rep.totalPredictions, 1u);
    EXPECT_EQ(rep.correctPredictions, 0u);
    EXPECT_EQ(rep.totalEarnings, 1000);
    EXPECT_EQ(rep.reputationScore, 0u);
}

TEST(ReputationTest, ScoreFloors) {
    Reputation rep;
    rep = ApplyOutcome(rep, true, 10);
    rep = ApplyOutcome(rep, false, 0);
    rep = ApplyOutcome(rep, false, 0);
    // 1 * 100 / 3
    EXPECT_EQ(rep.reputationScore, 33u);

    rep = ApplyOutcome(rep, true, 5);
    rep = ApplyOutcome(rep, true, 5);
    // 3 * 100 / 5
    EXPECT_EQ(rep.reputationScore, 60u);
    EXPECT_EQ(rep.totalEarnings, 20);
    EXPECT_LE(rep.correctPredictions, rep.totalPredictions);
}

// ============================================================================
// ReputationLedger
// ============================================================================

class ReputationLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<MarketStore>(db::OpenMemoryDatabase());
        ledger_ = std::make_unique<ReputationLedger>(*store_);
    }

    std::unique_ptr<MarketStore> store_;
    std::unique_ptr<ReputationLedger> ledger_;
};

TEST_F(ReputationLedgerTest, UnknownPrincipalHasDefaultScore) {
    Principal alice = MakePrincipal(1);
    EXPECT_FALSE(ledger_->Get(alice).has_value());
    EXPECT_EQ(ledger_->GetScore(alice), DEFAULT_REPUTATION_SCORE);
}

TEST_F(ReputationLedgerTest, UpdateIsStagedUntilCommit) {
    Principal alice = MakePrincipal(1);

    StateBatch batch;
    auto updated = ledger_->Update(batch, alice, true, 500);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->reputationScore, 100u);
    EXPECT_EQ(batch.Count(), 1u);

    EXPECT_FALSE(ledger_->Get(alice).has_value());

    ASSERT_TRUE(store_->Commit(batch).ok());
    auto stored = ledger_->Get(alice);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->totalPredictions, 1u);
    EXPECT_EQ(stored->totalEarnings, 500);
    EXPECT_EQ(ledger_->GetScore(alice), 100u);
}

TEST_F(ReputationLedgerTest, UpdatesAccumulate) {
    Principal alice = MakePrincipal(1);
    Principal bob = MakePrincipal(2);

    for (bool correct : {true, false, true, true}) {
        StateBatch batch;
        ASSERT_TRUE(ledger_->Update(batch, alice, correct, 100).has_value());
        ASSERT_TRUE(store_->Commit(batch).ok());
    }

    auto rep = ledger_->Get(alice);
    ASSERT_TRUE(rep.has_value());
    EXPECT_EQ(rep->totalPredictions, 4u);
    EXPECT_EQ(rep->correctPredictions, 3u);
    EXPECT_EQ(rep->totalEarnings, 400);
    EXPECT_EQ(rep->reputationScore, 75u);

    EXPECT_EQ(ledger_->GetScore(bob), DEFAULT_REPUTATION_SCORE);
}

TEST_F(ReputationLedgerTest, CorruptRecordFailsUpdate) {
    Principal alice = MakePrincipal(1);
    ASSERT_TRUE(store_->GetDatabase().Put(db::Slice(ReputationKey(alice)),
                                          db::Slice(std::string("\x01", 1))).ok());

    StateBatch batch;
    EXPECT_FALSE(ledger_->Update(batch, alice, true, 1).has_value());
    EXPECT_TRUE(batch.Empty());
    EXPECT_FALSE(ledger_->Get(alice).has_value());
}
