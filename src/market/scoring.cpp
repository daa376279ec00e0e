// FORESIGHT - Accuracy Scoring Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/scoring.h"
#include "foresight/core/arith.h"

namespace foresight {
namespace market {

bool IsDirectionCorrect(Sentiment sentiment, Price initialPrice, Price actualPrice) {
    switch (sentiment) {
        case Sentiment::Bullish:
            return actualPrice >= initialPrice;
        case Sentiment::Bearish:
            return actualPrice < initialPrice;
        case Sentiment::Neutral: {
            if (initialPrice == 0) {
                return false;
            }
            auto deviation = MulDivFloor(AbsDiff(actualPrice, initialPrice), 100, initialPrice);
            return deviation && *deviation <= NEUTRAL_BAND_PERCENT;
        }
    }
    return false;
}

Score CalculatePriceAccuracy(Price predictedPrice, Price actualPrice) {
    if (actualPrice == 0) {
        return 0;
    }

    // An error too large for 64 bits is far beyond 100%
    auto errorPercent = MulDivFloor(AbsDiff(predictedPrice, actualPrice), 100, actualPrice);
    if (!errorPercent || *errorPercent >= 100) {
        return 0;
    }
    return static_cast<Score>(100 - *errorPercent);
}

Score CalculateAccuracyScore(Price predictedPrice, Price actualPrice,
                             Sentiment sentiment, Price initialPrice) {
    Score priceAccuracy = CalculatePriceAccuracy(predictedPrice, actualPrice);
    if (IsDirectionCorrect(sentiment, initialPrice, actualPrice)) {
        return (priceAccuracy + 100) / 2;
    }
    return priceAccuracy / 2;
}

} // namespace market
} // namespace foresight
