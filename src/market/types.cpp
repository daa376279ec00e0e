// FORESIGHT - Market Types Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/types.h"

#include <sstream>

namespace foresight {
namespace market {

bool IsValidAssetId(const AssetId& asset) {
    return !asset.empty() && asset.size() <= MAX_ASSET_ID_LENGTH;
}

// ============================================================================
// Sentiment
// ============================================================================

std::optional<Sentiment> ParseSentiment(uint8_t value) {
    switch (value) {
        case 1: return Sentiment::Bearish;
        case 2: return Sentiment::Neutral;
        case 3: return Sentiment::Bullish;
        default: return std::nullopt;
    }
}

const char* SentimentToString(Sentiment sentiment) {
    switch (sentiment) {
        case Sentiment::Bearish: return "Bearish";
        case Sentiment::Neutral: return "Neutral";
        case Sentiment::Bullish: return "Bullish";
        default:                 return "Unknown";
    }
}

// ============================================================================
// Errors
// ============================================================================

const char* MarketErrorToString(MarketError err) {
    switch (err) {
        case MarketError::OK:                return "OK";
        case MarketError::OwnerOnly:         return "OwnerOnly";
        case MarketError::NotFound:          return "NotFound";
        case MarketError::InsufficientStake: return "InsufficientStake";
        case MarketError::InvalidSentiment:  return "InvalidSentiment";
        case MarketError::InvalidTimeframe:  return "InvalidTimeframe";
        case MarketError::InvalidAsset:      return "InvalidAsset";
        case MarketError::InvalidAmount:     return "InvalidAmount";
        case MarketError::InvalidParameter:  return "InvalidParameter";
        case MarketError::PredictionClosed:  return "PredictionClosed";
        case MarketError::PredictionActive:  return "PredictionActive";
        case MarketError::AlreadyResolved:   return "AlreadyResolved";
        case MarketError::AlreadyPredicted:  return "AlreadyPredicted";
        case MarketError::TransferFailed:    return "TransferFailed";
        case MarketError::StorageError:      return "StorageError";
        default:                             return "Unknown";
    }
}

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:          return "None";
        case ErrorCategory::Authorization: return "Authorization";
        case ErrorCategory::NotFound:      return "NotFound";
        case ErrorCategory::Validation:    return "Validation";
        case ErrorCategory::Phase:         return "Phase";
        case ErrorCategory::External:      return "External";
        default:                           return "Unknown";
    }
}

ErrorCategory GetErrorCategory(MarketError err) {
    switch (err) {
        case MarketError::OK:
            return ErrorCategory::None;
        case MarketError::OwnerOnly:
            return ErrorCategory::Authorization;
        case MarketError::NotFound:
            return ErrorCategory::NotFound;
        case MarketError::InsufficientStake:
        case MarketError::InvalidSentiment:
        case MarketError::InvalidTimeframe:
        case MarketError::InvalidAsset:
        case MarketError::InvalidAmount:
        case MarketError::InvalidParameter:
            return ErrorCategory::Validation;
        case MarketError::PredictionClosed:
        case MarketError::PredictionActive:
        case MarketError::AlreadyResolved:
        case MarketError::AlreadyPredicted:
            return ErrorCategory::Phase;
        case MarketError::TransferFailed:
        case MarketError::StorageError:
            return ErrorCategory::External;
    }
    return ErrorCategory::External;
}

// ============================================================================
// Round
// ============================================================================

const char* RoundPhaseToString(RoundPhase phase) {
    switch (phase) {
        case RoundPhase::Open:               return "Open";
        case RoundPhase::AwaitingResolution: return "AwaitingResolution";
        case RoundPhase::Resolved:           return "Resolved";
        default:                             return "Unknown";
    }
}

RoundPhase Round::PhaseAt(Height height) const {
    if (resolved) {
        return RoundPhase::Resolved;
    }
    if (height <= endHeight) {
        return RoundPhase::Open;
    }
    return RoundPhase::AwaitingResolution;
}

std::string Round::ToString() const {
    std::ostringstream ss;
    ss << "Round { asset: " << asset
       << ", id: " << id
       << ", start: " << startHeight
       << ", end: " << endHeight
       << ", target: " << targetHeight
       << ", initial: " << initialPrice
       << ", final: " << finalPrice
       << ", staked: " << totalStake
       << ", resolved: " << (resolved ? "yes" : "no")
       << " }";
    return ss.str();
}

std::string Prediction::ToString() const {
    std::ostringstream ss;
    ss << "Prediction { predictor: " << predictor.ToHex()
       << ", sentiment: " << SentimentToString(sentiment)
       << ", price: " << predictedPrice
       << ", stake: " << stake
       << ", height: " << submitHeight
       << ", rewarded: " << (rewarded ? "yes" : "no")
       << " }";
    return ss.str();
}

std::string SentimentAggregate::ToString() const {
    std::ostringstream ss;
    ss << "SentimentAggregate { bearish: " << bearishCount
       << ", neutral: " << neutralCount
       << ", bullish: " << bullishCount
       << ", total: " << totalPredictions
       << ", weighted: " << weightedSentiment
       << " }";
    return ss.str();
}

std::string Reputation::ToString() const {
    std::ostringstream ss;
    ss << "Reputation { total: " << totalPredictions
       << ", correct: " << correctPredictions
       << ", earnings: " << totalEarnings
       << ", score: " << reputationScore
       << " }";
    return ss.str();
}

std::string MarketStats::ToString() const {
    std::ostringstream ss;
    ss << "MarketStats { rounds: " << totalRounds
       << ", resolved: " << totalResolved
       << ", predictions: " << totalPredictions
       << ", claims: " << totalClaims
       << ", volume: " << totalVolume
       << ", paid: " << totalPaidOut
       << ", fees: " << totalFeesRetained
       << " }";
    return ss.str();
}

std::string ClaimReceipt::ToString() const {
    std::ostringstream ss;
    ss << "ClaimReceipt { accuracy: " << accuracyScore
       << ", reward: " << rewardAmount
       << ", fee: " << protocolFee
       << ", correct: " << (isCorrect ? "yes" : "no")
       << " }";
    return ss.str();
}

} // namespace market
} // namespace foresight
