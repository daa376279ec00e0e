// FORESIGHT - Market Types
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Records and status codes shared by the prediction market engine.

#ifndef FORESIGHT_MARKET_TYPES_H
#define FORESIGHT_MARKET_TYPES_H

#include "foresight/core/types.h"
#include "foresight/core/serialize.h"

#include <cstdint>
#include <ios>
#include <optional>
#include <string>

namespace foresight {
namespace market {

// ============================================================================
// Identifiers and Constants
// ============================================================================

/// Asset symbol, 1..MAX_ASSET_ID_LENGTH characters
using AssetId = std::string;

/// Round number; allocated from a single market-wide counter starting at 1
using RoundId = uint64_t;

/// Integer price in the asset's smallest quote unit
using Price = uint64_t;

/// Accuracy or reputation score in [0, 100]
using Score = uint32_t;

constexpr size_t MAX_ASSET_ID_LENGTH = 20;

/// Reputation reported for a principal with no claim history
constexpr Score DEFAULT_REPUTATION_SCORE = 50;

/// Default minimum stake in base units
constexpr Amount DEFAULT_MINIMUM_STAKE = 1000000;

/// Default protocol fee percentage
constexpr uint32_t DEFAULT_FEE_PERCENTAGE = 5;

/// Predictions scoring at or above this are counted as correct
constexpr Score CORRECT_THRESHOLD = 50;

/// Neutral is directionally correct within this percent of the initial price
constexpr uint64_t NEUTRAL_BAND_PERCENT = 5;

/// True for a non-empty asset id of at most MAX_ASSET_ID_LENGTH characters
bool IsValidAssetId(const AssetId& asset);

// ============================================================================
// Sentiment
// ============================================================================

enum class Sentiment : uint8_t {
    Bearish = 1,
    Neutral = 2,
    Bullish = 3,
};

/// Convert a wire value to a sentiment; nullopt outside 1..3
std::optional<Sentiment> ParseSentiment(uint8_t value);

const char* SentimentToString(Sentiment sentiment);

// ============================================================================
// Errors
// ============================================================================

enum class MarketError {
    OK = 0,

    // Authorization
    OwnerOnly,

    // Lookup
    NotFound,

    // Validation
    InsufficientStake,
    InvalidSentiment,
    InvalidTimeframe,
    InvalidAsset,
    InvalidAmount,
    InvalidParameter,

    // Phase
    PredictionClosed,
    PredictionActive,
    AlreadyResolved,
    AlreadyPredicted,

    // External collaborators
    TransferFailed,
    StorageError,
};

enum class ErrorCategory {
    None,
    Authorization,
    NotFound,
    Validation,
    Phase,
    External,
};

const char* MarketErrorToString(MarketError err);
const char* ErrorCategoryToString(ErrorCategory category);
ErrorCategory GetErrorCategory(MarketError err);

// ============================================================================
// Round Phase
// ============================================================================

enum class RoundPhase {
    /// Submissions accepted (height <= end height)
    Open,
    /// Submission window closed, not yet resolved
    AwaitingResolution,
    /// Final price recorded, claims accepted
    Resolved,
};

const char* RoundPhaseToString(RoundPhase phase);

// ============================================================================
// Round
// ============================================================================

struct Round {
    AssetId asset;
    RoundId id{0};
    Height startHeight{0};
    /// Last height at which predictions are accepted
    Height endHeight{0};
    /// First height at which the round may be resolved
    Height targetHeight{0};
    Price initialPrice{0};
    /// Zero until resolved
    Price finalPrice{0};
    /// Sum of all accepted stakes
    Amount totalStake{0};
    bool resolved{false};
    Principal creator;

    /// Phase at the given height
    RoundPhase PhaseAt(Height height) const;

    std::string ToString() const;
};

// ============================================================================
// Prediction
// ============================================================================

struct Prediction {
    Principal predictor;
    Sentiment sentiment{Sentiment::Neutral};
    Price predictedPrice{0};
    Amount stake{0};
    Height submitHeight{0};
    bool rewarded{false};

    std::string ToString() const;
};

// ============================================================================
// Sentiment Aggregate
// ============================================================================

/**
 * Per-round sentiment tally with a streaming integer average of the
 * sentiment values (1 bearish, 2 neutral, 3 bullish).
 */
struct SentimentAggregate {
    uint64_t bearishCount{0};
    uint64_t neutralCount{0};
    uint64_t bullishCount{0};
    uint64_t totalPredictions{0};
    uint64_t weightedSentiment{0};

    /// Count one submission and fold it into the running average
    void Record(Sentiment sentiment);

    /// Sentiment nearest to the running average; nullopt with no submissions
    std::optional<Sentiment> CrowdSentiment() const;

    bool IsConsistent() const {
        return bearishCount + neutralCount + bullishCount == totalPredictions;
    }

    std::string ToString() const;
};

// ============================================================================
// Reputation
// ============================================================================

struct Reputation {
    uint64_t totalPredictions{0};
    uint64_t correctPredictions{0};
    /// Cumulative net rewards received
    Amount totalEarnings{0};
    Score reputationScore{DEFAULT_REPUTATION_SCORE};

    std::string ToString() const;
};

// ============================================================================
// Market Stats
// ============================================================================

struct MarketStats {
    /// Rounds created; the last allocated round id
    uint64_t totalRounds{0};
    uint64_t totalResolved{0};
    uint64_t totalPredictions{0};
    uint64_t totalClaims{0};
    /// Sum of all accepted stakes
    Amount totalVolume{0};
    /// Net rewards paid out of escrow
    Amount totalPaidOut{0};
    /// Protocol fees retained in escrow
    Amount totalFeesRetained{0};

    std::string ToString() const;
};

// ============================================================================
// Claim Receipt
// ============================================================================

struct ClaimReceipt {
    Score accuracyScore{0};
    /// Net reward transferred to the claimant
    Amount rewardAmount{0};
    Amount protocolFee{0};
    bool isCorrect{false};

    std::string ToString() const;
};

// ============================================================================
// Serialization
// ============================================================================

using ::foresight::Serialize;
using ::foresight::Unserialize;

template<typename Stream>
void Serialize(Stream& s, Sentiment sentiment) {
    Serialize(s, static_cast<uint8_t>(sentiment));
}

template<typename Stream>
void Unserialize(Stream& s, Sentiment& sentiment) {
    uint8_t raw;
    Unserialize(s, raw);
    auto parsed = ParseSentiment(raw);
    if (!parsed) {
        throw std::ios_base::failure("invalid sentiment value");
    }
    sentiment = *parsed;
}

template<typename Stream>
void Serialize(Stream& s, const Round& r) {
    Serialize(s, r.asset);
    Serialize(s, r.id);
    Serialize(s, r.startHeight);
    Serialize(s, r.endHeight);
    Serialize(s, r.targetHeight);
    Serialize(s, r.initialPrice);
    Serialize(s, r.finalPrice);
    Serialize(s, r.totalStake);
    Serialize(s, r.resolved);
    Serialize(s, r.creator);
}

template<typename Stream>
void Unserialize(Stream& s, Round& r) {
    Unserialize(s, r.asset);
    Unserialize(s, r.id);
    Unserialize(s, r.startHeight);
    Unserialize(s, r.endHeight);
    Unserialize(s, r.targetHeight);
    Unserialize(s, r.initialPrice);
    Unserialize(s, r.finalPrice);
    Unserialize(s, r.totalStake);
    Unserialize(s, r.resolved);
    Unserialize(s, r.creator);
}

template<typename Stream>
void Serialize(Stream& s, const Prediction& p) {
    Serialize(s, p.predictor);
    Serialize(s, p.sentiment);
    Serialize(s, p.predictedPrice);
    Serialize(s, p.stake);
    Serialize(s, p.submitHeight);
    Serialize(s, p.rewarded);
}

template<typename Stream>
void Unserialize(Stream& s, Prediction& p) {
    Unserialize(s, p.predictor);
    Unserialize(s, p.sentiment);
    Unserialize(s, p.predictedPrice);
    Unserialize(s, p.stake);
    Unserialize(s, p.submitHeight);
    Unserialize(s, p.rewarded);
}

template<typename Stream>
void Serialize(Stream& s, const SentimentAggregate& a) {
    Serialize(s, a.bearishCount);
    Serialize(s, a.neutralCount);
    Serialize(s, a.bullishCount);
    Serialize(s, a.totalPredictions);
    Serialize(s, a.weightedSentiment);
}

template<typename Stream>
void Unserialize(Stream& s, SentimentAggregate& a) {
    Unserialize(s, a.bearishCount);
    Unserialize(s, a.neutralCount);
    Unserialize(s, a.bullishCount);
    Unserialize(s, a.totalPredictions);
    Unserialize(s, a.weightedSentiment);
}

template<typename Stream>
void Serialize(Stream& s, const Reputation& r) {
    Serialize(s, r.totalPredictions);
    Serialize(s, r.correctPredictions);
    Serialize(s, r.totalEarnings);
    Serialize(s, r.reputationScore);
}

template<typename Stream>
void Unserialize(Stream& s, Reputation& r) {
    Unserialize(s, r.totalPredictions);
    Unserialize(s, r.correctPredictions);
    Unserialize(s, r.totalEarnings);
    Unserialize(s, r.reputationScore);
}

template<typename Stream>
void Serialize(Stream& s, const MarketStats& m) {
    Serialize(s, m.totalRounds);
    Serialize(s, m.totalResolved);
    Serialize(s, m.totalPredictions);
    Serialize(s, m.totalClaims);
    Serialize(s, m.totalVolume);
    Serialize(s, m.totalPaidOut);
    Serialize(s, m.totalFeesRetained);
}

template<typename Stream>
void Unserialize(Stream& s, MarketStats& m) {
    Unserialize(s, m.totalRounds);
    Unserialize(s, m.totalResolved);
    Unserialize(s, m.totalPredictions);
    Unserialize(s, m.totalClaims);
    Unserialize(s, m.totalVolume);
    Unserialize(s, m.totalPaidOut);
    Unserialize(s, m.totalFeesRetained);
}

} // namespace market
} // namespace foresight

#endif // FORESIGHT_MARKET_TYPES_H
