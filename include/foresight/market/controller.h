// FORESIGHT - Round Lifecycle Controller
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Entry point for every market transition: round creation, prediction
// submission, resolution and reward claims. Each transition is validated
// completely before anything is written and commits as one atomic batch.

#ifndef FORESIGHT_MARKET_CONTROLLER_H
#define FORESIGHT_MARKET_CONTROLLER_H

#include "foresight/market/journal.h"
#include "foresight/market/ledger.h"
#include "foresight/market/params.h"
#include "foresight/market/store.h"
#include "foresight/market/types.h"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace foresight {
namespace market {

/**
 * Round lifecycle state machine.
 *
 * Round phases: Open (height <= end) -> AwaitingResolution -> Resolved.
 * Predictions: Submitted -> Claimed.
 *
 * All operations are serialized. A rejected operation leaves the store and
 * the escrow ledger untouched. If the store commit fails after funds moved,
 * the ledger transfer is reversed and StorageError is returned.
 */
class RoundController {
public:
    /**
     * @param store Market state; owned by the controller
     * @param ledger Escrow ledger shared with the host
     * @param defaults Parameters used when the store holds none
     */
    RoundController(std::unique_ptr<MarketStore> store,
                    std::shared_ptr<IEscrowLedger> ledger,
                    const MarketParams& defaults);

    RoundController(const RoundController&) = delete;
    RoundController& operator=(const RoundController&) = delete;

    /// Load persisted parameters, or persist the defaults on first start
    MarketError Initialize();

    bool IsInitialized() const;

    // ========================================================================
    // Transitions
    // ========================================================================

    /**
     * Open a new round. Predictions are accepted through height + duration,
     * resolution from height + duration + evaluation.
     * @param roundId Receives the allocated id
     */
    MarketError CreateRound(const Principal& caller, const AssetId& asset,
                            Height duration, Height evaluation, Price initialPrice,
                            Height height, RoundId& roundId);

    /// Stake on a sentiment (1 bearish, 2 neutral, 3 bullish) and a price target
    MarketError SubmitPrediction(const Principal& caller, const AssetId& asset, RoundId roundId,
                                 uint8_t sentiment, Price predictedPrice, Amount stake,
                                 Height height);

    /// Record the final price. Only the owner or the round creator may resolve.
    MarketError ResolveRound(const Principal& caller, const AssetId& asset, RoundId roundId,
                             Price finalPrice, Height height);

    /// Score the caller's prediction and pay the net reward out of escrow
    MarketError ClaimReward(const Principal& caller, const AssetId& asset, RoundId roundId,
                            Height height, ClaimReceipt& receipt);

    /// Owner only
    MarketError SetMinimumStake(const Principal& caller, Amount amount, Height height);

    /// Owner only; percent must be in 0..100
    MarketError SetFeePercentage(const Principal& caller, uint32_t percent, Height height);

    // ========================================================================
    // Views
    // ========================================================================

    std::optional<Round> GetRound(const AssetId& asset, RoundId roundId) const;
    std::optional<Prediction> GetPrediction(const AssetId& asset, RoundId roundId,
                                            const Principal& who) const;
    std::optional<SentimentAggregate> GetAggregate(const AssetId& asset, RoundId roundId) const;
    std::optional<Reputation> GetReputation(const Principal& who) const;

    /// DEFAULT_REPUTATION_SCORE for a principal with no claims
    Score GetReputationScore(const Principal& who) const;

    std::optional<RoundPhase> GetRoundPhase(const AssetId& asset, RoundId roundId,
                                            Height height) const;

    std::vector<Prediction> ListPredictions(const AssetId& asset, RoundId roundId) const;

    MarketStats GetMarketStats() const;
    MarketParams GetParams() const;
    JournalHead GetJournalHead() const;

    /// Head digest of the transition journal; null before the first transition
    Hash256 GetStateDigest() const;

    const MarketStore& GetStore() const { return *store_; }

private:
    MarketError CheckInitialized(const char* op) const;
    MarketError Reject(const char* op, MarketError err) const;
    MarketError StorageFailure(const char* op, const db::Status& status) const;

    MarketError LoadStats(const char* op, MarketStats& stats) const;
    MarketError LoadRound(const char* op, const AssetId& asset, RoundId roundId, Round& round) const;

    /// Chain the entry onto the journal and stage it
    MarketError StageJournal(const char* op, StateBatch& batch, JournalEntry& entry) const;

    bool IsOwner(const Principal& caller) const;

    mutable std::mutex mutex_;
    std::unique_ptr<MarketStore> store_;
    std::shared_ptr<IEscrowLedger> ledger_;
    MarketParams params_;
    bool initialized_{false};
};

} // namespace market
} // namespace foresight

#endif // FORESIGHT_MARKET_CONTROLLER_H
