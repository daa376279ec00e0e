// FORESIGHT - Accuracy Scoring
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Hybrid accuracy score in [0, 100] combining directional correctness with
// numeric proximity of the predicted price. Integer floor arithmetic only.

#ifndef FORESIGHT_MARKET_SCORING_H
#define FORESIGHT_MARKET_SCORING_H

#include "foresight/market/types.h"

namespace foresight {
namespace market {

/**
 * Whether a sentiment called the move from initial to actual correctly.
 *
 * Bullish: actual >= initial. Bearish: actual < initial.
 * Neutral: |actual - initial| * 100 / initial <= NEUTRAL_BAND_PERCENT.
 * A zero initial price never counts as neutral-correct.
 */
bool IsDirectionCorrect(Sentiment sentiment, Price initialPrice, Price actualPrice);

/// 100 - |predicted - actual| * 100 / actual, clamped at 0; 0 when actual is 0
Score CalculatePriceAccuracy(Price predictedPrice, Price actualPrice);

/**
 * Final accuracy score.
 *
 * Direction correct: (priceAccuracy + 100) / 2, so in [50, 100].
 * Direction wrong:   priceAccuracy / 2, so in [0, 50].
 */
Score CalculateAccuracyScore(Price predictedPrice, Price actualPrice,
                             Sentiment sentiment, Price initialPrice);

} // namespace market
} // namespace foresight

#endif // FORESIGHT_MARKET_SCORING_H
