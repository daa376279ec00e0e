// FORESIGHT - Round Lifecycle Controller Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/controller.h"
#include "foresight/market/reputation.h"
#include "foresight/market/reward.h"
#include "foresight/market/scoring.h"
#include "foresight/core/arith.h"
#include "foresight/util/logging.h"

namespace foresight {
namespace market {

RoundController::RoundController(std::unique_ptr<MarketStore> store,
                                 std::shared_ptr<IEscrowLedger> ledger,
                                 const MarketParams& defaults)
    : store_(std::move(store)), ledger_(std::move(ledger)), params_(defaults) {}

MarketError RoundController::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    MarketParams stored;
    db::Status status = store_->ReadParams(stored);
    if (status.ok()) {
        std::string error;
        if (!stored.Validate(&error)) {
            LOG_ERROR(util::LogCategory::MARKET) << "Stored market parameters are invalid: " << error;
            return MarketError::StorageError;
        }
        params_ = stored;
        initialized_ = true;
        LOG_INFO(util::LogCategory::MARKET) << "Loaded " << params_.ToString();
        return MarketError::OK;
    }
    if (!status.IsNotFound()) {
        return StorageFailure("Initialize", status);
    }

    std::string error;
    if (!params_.Validate(&error)) {
        LOG_ERROR(util::LogCategory::MARKET) << "Invalid market parameters: " << error;
        return MarketError::InvalidParameter;
    }

    StateBatch batch;
    batch.PutParams(params_);
    batch.PutStats(MarketStats());
    status = store_->Commit(batch);
    if (!status.ok()) {
        return StorageFailure("Initialize", status);
    }

    initialized_ = true;
    LOG_INFO(util::LogCategory::MARKET) << "Initialized new market with " << params_.ToString();
    return MarketError::OK;
}

bool RoundController::IsInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

// ============================================================================
// Helpers
// ============================================================================

MarketError RoundController::CheckInitialized(const char* op) const {
    if (!initialized_) {
        LOG_ERROR(util::LogCategory::MARKET) << op << " called before Initialize";
        return MarketError::StorageError;
    }
    return MarketError::OK;
}

MarketError RoundController::Reject(const char* op, MarketError err) const {
    LOG_DEBUG(util::LogCategory::MARKET) << op << " rejected: " << MarketErrorToString(err)
                                          << " [" << ErrorCategoryToString(GetErrorCategory(err)) << "]";
    return err;
}

MarketError RoundController::StorageFailure(const char* op, const db::Status& status) const {
    LOG_ERROR(util::LogCategory::MARKET) << op << " storage failure: " << status.ToString();
    return MarketError::StorageError;
}

MarketError RoundController::LoadStats(const char* op, MarketStats& stats) const {
    db::Status status = store_->ReadStats(stats);
    if (status.IsNotFound()) {
        stats = MarketStats();
        return MarketError::OK;
    }
    return status.ok() ? MarketError::OK : StorageFailure(op, status);
}

MarketError RoundController::LoadRound(const char* op, const AssetId& asset, RoundId roundId,
                                       Round& round) const {
    db::Status status = store_->ReadRound(asset, roundId, round);
    if (status.IsNotFound()) {
        return Reject(op, MarketError::NotFound);
    }
    return status.ok() ? MarketError::OK : StorageFailure(op, status);
}

MarketError RoundController::StageJournal(const char* op, StateBatch& batch,
                                          JournalEntry& entry) const {
    JournalHead head;
    db::Status status = store_->ReadJournalHead(head);
    if (status.IsNotFound()) {
        head = JournalHead();
    } else if (!status.ok()) {
        return StorageFailure(op, status);
    }

    JournalHead next = ChainEntry(head, entry);
    batch.PutJournal(entry, next);
    LOG_TRACE(util::LogCategory::JOURNAL) << entry.ToString();
    return MarketError::OK;
}

bool RoundController::IsOwner(const Principal& caller) const {
    return !params_.owner.IsNull() && caller == params_.owner;
}

// ============================================================================
// Create
// ============================================================================

MarketError RoundController::CreateRound(const Principal& caller, const AssetId& asset,
                                         Height duration, Height evaluation, Price initialPrice,
                                         Height height, RoundId& roundId) {
    static const char* OP = "CreateRound";
    std::lock_guard<std::mutex> lock(mutex_);

    MarketError err = CheckInitialized(OP);
    if (err != MarketError::OK) return err;

    if (duration == 0 || evaluation == 0 || initialPrice == 0) {
        return Reject(OP, MarketError::InvalidTimeframe);
    }
    if (!IsValidAssetId(asset)) {
        return Reject(OP, MarketError::InvalidAsset);
    }

    auto endHeight = CheckedAdd(height, duration);
    if (!endHeight) {
        return Reject(OP, MarketError::InvalidTimeframe);
    }
    auto targetHeight = CheckedAdd(*endHeight, evaluation);
    if (!targetHeight) {
        return Reject(OP, MarketError::InvalidTimeframe);
    }

    MarketStats stats;
    err = LoadStats(OP, stats);
    if (err != MarketError::OK) return err;

    Round round;
    round.asset = asset;
    round.id = stats.totalRounds + 1;
    round.startHeight = height;
    round.endHeight = *endHeight;
    round.targetHeight = *targetHeight;
    round.initialPrice = initialPrice;
    round.creator = caller;

    stats.totalRounds = round.id;

    StateBatch batch;
    batch.PutRound(round);
    batch.PutAggregate(asset, round.id, SentimentAggregate());
    batch.PutStats(stats);

    JournalEntry entry;
    entry.kind = TransitionKind::CreateRound;
    entry.asset = asset;
    entry.roundId = round.id;
    entry.actor = caller;
    entry.height = height;
    entry.args = {duration, evaluation, initialPrice};
    err = StageJournal(OP, batch, entry);
    if (err != MarketError::OK) return err;

    db::Status status = store_->Commit(batch);
    if (!status.ok()) {
        return StorageFailure(OP, status);
    }

    roundId = round.id;
    LOG_INFO(util::LogCategory::MARKET) << "Created " << round.ToString();
    return MarketError::OK;
}

// ============================================================================
// Submit
// ============================================================================

MarketError RoundController::SubmitPrediction(const Principal& caller, const AssetId& asset,
                                              RoundId roundId, uint8_t sentiment,
                                              Price predictedPrice, Amount stake, Height height) {
    static const char* OP = "SubmitPrediction";
    std::lock_guard<std::mutex> lock(mutex_);

    MarketError err = CheckInitialized(OP);
    if (err != MarketError::OK) return err;

    Round round;
    err = LoadRound(OP, asset, roundId, round);
    if (err != MarketError::OK) return err;

    auto parsed = ParseSentiment(sentiment);
    if (!parsed) {
        return Reject(OP, MarketError::InvalidSentiment);
    }
    if (stake < params_.minimumStake) {
        return Reject(OP, MarketError::InsufficientStake);
    }

    MarketStats stats;
    err = LoadStats(OP, stats);
    if (err != MarketError::OK) return err;

    if (!MoneyRange(stake) ||
        !MoneyRange(round.totalStake + stake) ||
        !MoneyRange(stats.totalVolume + stake)) {
        return Reject(OP, MarketError::InvalidAmount);
    }

    if (height > round.endHeight) {
        return Reject(OP, MarketError::PredictionClosed);
    }

    Prediction existing;
    db::Status status = store_->ReadPrediction(asset, roundId, caller, existing);
    if (status.ok()) {
        return Reject(OP, MarketError::AlreadyPredicted);
    }
    if (!status.IsNotFound()) {
        return StorageFailure(OP, status);
    }

    if (round.resolved) {
        return Reject(OP, MarketError::AlreadyResolved);
    }

    SentimentAggregate aggregate;
    status = store_->ReadAggregate(asset, roundId, aggregate);
    if (!status.ok()) {
        return StorageFailure(OP, status);
    }

    Prediction prediction;
    prediction.predictor = caller;
    prediction.sentiment = *parsed;
    prediction.predictedPrice = predictedPrice;
    prediction.stake = stake;
    prediction.submitHeight = height;

    aggregate.Record(*parsed);
    round.totalStake += stake;
    ++stats.totalPredictions;
    stats.totalVolume += stake;

    StateBatch batch;
    batch.PutPrediction(asset, roundId, prediction);
    batch.PutAggregate(asset, roundId, aggregate);
    batch.PutRound(round);
    batch.PutStats(stats);

    JournalEntry entry;
    entry.kind = TransitionKind::SubmitPrediction;
    entry.asset = asset;
    entry.roundId = roundId;
    entry.actor = caller;
    entry.height = height;
    entry.args = {sentiment, predictedPrice, static_cast<uint64_t>(stake)};
    err = StageJournal(OP, batch, entry);
    if (err != MarketError::OK) return err;

    if (!ledger_->Lock(caller, stake)) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Escrow lock of " << stake << " from "
                                             << caller.ToHex() << " failed";
        return MarketError::TransferFailed;
    }

    status = store_->Commit(batch);
    if (!status.ok()) {
        if (!ledger_->Release(caller, stake)) {
            LOG_FATAL(util::LogCategory::LEDGER) << "Could not return " << stake << " to "
                                                 << caller.ToHex() << " after failed commit";
        }
        return StorageFailure(OP, status);
    }

    LOG_INFO(util::LogCategory::MARKET) << "Prediction on " << asset << "/" << roundId
                                        << ": " << prediction.ToString();
    return MarketError::OK;
}

// ============================================================================
// Resolve
// ============================================================================

MarketError RoundController::ResolveRound(const Principal& caller, const AssetId& asset,
                                          RoundId roundId, Price finalPrice, Height height) {
    static const char* OP = "ResolveRound";
    std::lock_guard<std::mutex> lock(mutex_);

    MarketError err = CheckInitialized(OP);
    if (err != MarketError::OK) return err;

    Round round;
    err = LoadRound(OP, asset, roundId, round);
    if (err != MarketError::OK) return err;

    if (!IsOwner(caller) && caller != round.creator) {
        return Reject(OP, MarketError::OwnerOnly);
    }
    if (height < round.targetHeight) {
        return Reject(OP, MarketError::PredictionActive);
    }
    if (round.resolved) {
        return Reject(OP, MarketError::AlreadyResolved);
    }
    if (finalPrice == 0) {
        return Reject(OP, MarketError::InvalidTimeframe);
    }

    MarketStats stats;
    err = LoadStats(OP, stats);
    if (err != MarketError::OK) return err;

    round.finalPrice = finalPrice;
    round.resolved = true;
    ++stats.totalResolved;

    StateBatch batch;
    batch.PutRound(round);
    batch.PutStats(stats);

    JournalEntry entry;
    entry.kind = TransitionKind::ResolveRound;
    entry.asset = asset;
    entry.roundId = roundId;
    entry.actor = caller;
    entry.height = height;
    entry.args = {finalPrice};
    err = StageJournal(OP, batch, entry);
    if (err != MarketError::OK) return err;

    db::Status status = store_->Commit(batch);
    if (!status.ok()) {
        return StorageFailure(OP, status);
    }

    LOG_INFO(util::LogCategory::MARKET) << "Resolved " << round.ToString();
    return MarketError::OK;
}

// ============================================================================
// Claim
// ============================================================================

MarketError RoundController::ClaimReward(const Principal& caller, const AssetId& asset,
                                         RoundId roundId, Height height, ClaimReceipt& receipt) {
    static const char* OP = "ClaimReward";
    std::lock_guard<std::mutex> lock(mutex_);

    MarketError err = CheckInitialized(OP);
    if (err != MarketError::OK) return err;

    Round round;
    err = LoadRound(OP, asset, roundId, round);
    if (err != MarketError::OK) return err;

    Prediction prediction;
    db::Status status = store_->ReadPrediction(asset, roundId, caller, prediction);
    if (status.IsNotFound()) {
        return Reject(OP, MarketError::NotFound);
    }
    if (!status.ok()) {
        return StorageFailure(OP, status);
    }

    if (!round.resolved) {
        return Reject(OP, MarketError::PredictionActive);
    }
    if (prediction.rewarded) {
        return Reject(OP, MarketError::AlreadyPredicted);
    }
    if (round.finalPrice == 0) {
        return Reject(OP, MarketError::InvalidTimeframe);
    }

    Score accuracy = CalculateAccuracyScore(prediction.predictedPrice, round.finalPrice,
                                            prediction.sentiment, round.initialPrice);

    RewardCalculator calculator(params_.feePercentage);
    auto reward = calculator.Calculate(accuracy, prediction.stake, round.totalStake);
    if (!reward) {
        return Reject(OP, MarketError::InvalidAmount);
    }
    LOG_DEBUG(util::LogCategory::SCORING) << asset << "/" << roundId << " " << caller.ToHex()
                                          << ": " << reward->ToString();

    MarketStats stats;
    err = LoadStats(OP, stats);
    if (err != MarketError::OK) return err;

    prediction.rewarded = true;
    ++stats.totalClaims;
    stats.totalPaidOut += reward->netReward;
    stats.totalFeesRetained += reward->protocolFee;

    StateBatch batch;
    batch.PutPrediction(asset, roundId, prediction);
    batch.PutStats(stats);

    ReputationLedger reputation(*store_);
    if (!reputation.Update(batch, caller, reward->isCorrect, reward->netReward)) {
        return MarketError::StorageError;
    }

    JournalEntry entry;
    entry.kind = TransitionKind::ClaimReward;
    entry.asset = asset;
    entry.roundId = roundId;
    entry.actor = caller;
    entry.height = height;
    entry.args = {accuracy, static_cast<uint64_t>(reward->netReward),
                  static_cast<uint64_t>(reward->protocolFee)};
    err = StageJournal(OP, batch, entry);
    if (err != MarketError::OK) return err;

    if (!ledger_->Release(caller, reward->netReward)) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Escrow release of " << reward->netReward
                                             << " to " << caller.ToHex() << " failed";
        return MarketError::TransferFailed;
    }

    status = store_->Commit(batch);
    if (!status.ok()) {
        if (reward->netReward > 0 && !ledger_->Lock(caller, reward->netReward)) {
            LOG_FATAL(util::LogCategory::LEDGER) << "Could not reclaim " << reward->netReward
                                                 << " from " << caller.ToHex()
                                                 << " after failed commit";
        }
        return StorageFailure(OP, status);
    }

    receipt.accuracyScore = accuracy;
    receipt.rewardAmount = reward->netReward;
    receipt.protocolFee = reward->protocolFee;
    receipt.isCorrect = reward->isCorrect;

    LOG_INFO(util::LogCategory::MARKET) << "Claim on " << asset << "/" << roundId << " by "
                                        << caller.ToHex() << ": " << receipt.ToString();
    return MarketError::OK;
}

// ============================================================================
// Parameters
// ============================================================================

MarketError RoundController::SetMinimumStake(const Principal& caller, Amount amount,
                                             Height height) {
    static const char* OP = "SetMinimumStake";
    std::lock_guard<std::mutex> lock(mutex_);

    MarketError err = CheckInitialized(OP);
    if (err != MarketError::OK) return err;

    if (!IsOwner(caller)) {
        return Reject(OP, MarketError::OwnerOnly);
    }
    if (!IsValidMinimumStake(amount)) {
        return Reject(OP, MarketError::InvalidParameter);
    }

    MarketParams updated = params_;
    updated.minimumStake = amount;

    StateBatch batch;
    batch.PutParams(updated);

    JournalEntry entry;
    entry.kind = TransitionKind::SetMinimumStake;
    entry.actor = caller;
    entry.height = height;
    entry.args = {static_cast<uint64_t>(amount)};
    err = StageJournal(OP, batch, entry);
    if (err != MarketError::OK) return err;

    db::Status status = store_->Commit(batch);
    if (!status.ok()) {
        return StorageFailure(OP, status);
    }

    params_ = updated;
    LogInfoF(util::LogCategory::MARKET, "Minimum stake set to %lld", static_cast<long long>(amount));
    return MarketError::OK;
}

MarketError RoundController::SetFeePercentage(const Principal& caller, uint32_t percent,
                                              Height height) {
    static const char* OP = "SetFeePercentage";
    std::lock_guard<std::mutex> lock(mutex_);

    MarketError err = CheckInitialized(OP);
    if (err != MarketError::OK) return err;

    if (!IsOwner(caller)) {
        return Reject(OP, MarketError::OwnerOnly);
    }
    if (!IsValidFeePercentage(percent)) {
        return Reject(OP, MarketError::InvalidParameter);
    }

    MarketParams updated = params_;
    updated.feePercentage = percent;

    StateBatch batch;
    batch.PutParams(updated);

    JournalEntry entry;
    entry.kind = TransitionKind::SetFeePercentage;
    entry.actor = caller;
    entry.height = height;
    entry.args = {percent};
    err = StageJournal(OP, batch, entry);
    if (err != MarketError::OK) return err;

    db::Status status = store_->Commit(batch);
    if (!status.ok()) {
        return StorageFailure(OP, status);
    }

    params_ = updated;
    LogInfoF(util::LogCategory::MARKET, "Protocol fee set to %u%%", percent);
    return MarketError::OK;
}

// ============================================================================
// Views
// ============================================================================

std::optional<Round> RoundController::GetRound(const AssetId& asset, RoundId roundId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Round round;
    if (!store_->ReadRound(asset, roundId, round).ok()) {
        return std::nullopt;
    }
    return round;
}

std::optional<Prediction> RoundController::GetPrediction(const AssetId& asset, RoundId roundId,
                                                         const Principal& who) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Prediction prediction;
    if (!store_->ReadPrediction(asset, roundId, who, prediction).ok()) {
        return std::nullopt;
    }
    return prediction;
}

std::optional<SentimentAggregate> RoundController::GetAggregate(const AssetId& asset,
                                                                RoundId roundId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    SentimentAggregate aggregate;
    if (!store_->ReadAggregate(asset, roundId, aggregate).ok()) {
        return std::nullopt;
    }
    return aggregate;
}

std::optional<Reputation> RoundController::GetReputation(const Principal& who) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReputationLedger(*store_).Get(who);
}

Score RoundController::GetReputationScore(const Principal& who) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReputationLedger(*store_).GetScore(who);
}

std::optional<RoundPhase> RoundController::GetRoundPhase(const AssetId& asset, RoundId roundId,
                                                         Height height) const {
    auto round = GetRound(asset, roundId);
    if (!round) {
        return std::nullopt;
    }
    return round->PhaseAt(height);
}

std::vector<Prediction> RoundController::ListPredictions(const AssetId& asset,
                                                         RoundId roundId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Prediction> result;
    db::Status status = store_->ListPredictions(asset, roundId, result);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::MARKET) << "Cannot list predictions of " << asset << "/"
                                             << roundId << ": " << status.ToString();
        result.clear();
    }
    return result;
}

MarketStats RoundController::GetMarketStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MarketStats stats;
    if (LoadStats("GetMarketStats", stats) != MarketError::OK) {
        return MarketStats();
    }
    return stats;
}

MarketParams RoundController::GetParams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_;
}

JournalHead RoundController::GetJournalHead() const {
    std::lock_guard<std::mutex> lock(mutex_);
    JournalHead head;
    db::Status status = store_->ReadJournalHead(head);
    if (!status.ok()) {
        if (!status.IsNotFound()) {
            LOG_ERROR(util::LogCategory::JOURNAL) << "Cannot read journal head: "
                                                  << status.ToString();
        }
        return JournalHead();
    }
    return head;
}

Hash256 RoundController::GetStateDigest() const {
    return GetJournalHead().digest;
}

} // namespace market
} // namespace foresight
