// FORESIGHT - Sentiment Aggregate Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/types.h"
#include "foresight/core/arith.h"

namespace foresight {
namespace market {

void SentimentAggregate::Record(Sentiment sentiment) {
    uint64_t value = static_cast<uint8_t>(sentiment);

    // weighted = (weighted * total + value) / (total + 1), truncating
    __uint128_t numerator = static_cast<__uint128_t>(weightedSentiment) * totalPredictions + value;
    weightedSentiment = static_cast<uint64_t>(numerator / (static_cast<__uint128_t>(totalPredictions) + 1));

    switch (sentiment) {
        case Sentiment::Bearish: ++bearishCount; break;
        case Sentiment::Neutral: ++neutralCount; break;
        case Sentiment::Bullish: ++bullishCount; break;
    }
    ++totalPredictions;
}

std::optional<Sentiment> SentimentAggregate::CrowdSentiment() const {
    if (totalPredictions == 0 || weightedSentiment == 0) {
        return std::nullopt;
    }
    if (weightedSentiment >= 3) {
        return Sentiment::Bullish;
    }
    return ParseSentiment(static_cast<uint8_t>(weightedSentiment));
}

} // namespace market
} // namespace foresight
