// FORESIGHT - Reward Calculation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Converts an accuracy score into a payout from the round pool:
//   base  = stake * accuracy / 100
//   bonus = pool  * accuracy / 10000
//   gross = base + bonus
// and splits the protocol fee off the gross reward.

#ifndef FORESIGHT_MARKET_REWARD_H
#define FORESIGHT_MARKET_REWARD_H

#include "foresight/market/types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace foresight {
namespace market {

/// Whether an accuracy score counts as a correct prediction
inline bool IsCorrectPrediction(Score accuracy) {
    return accuracy >= CORRECT_THRESHOLD;
}

/// Breakdown of a single claim payout
struct RewardBreakdown {
    Score accuracy{0};
    Amount baseReward{0};
    Amount poolBonus{0};
    Amount grossReward{0};
    Amount protocolFee{0};
    Amount netReward{0};
    bool isCorrect{false};

    /// Parts sum to the gross reward
    bool IsValid() const {
        return baseReward + poolBonus == grossReward &&
               protocolFee + netReward == grossReward;
    }

    std::string ToString() const;
};

/**
 * Reward arithmetic for a fixed protocol fee percentage.
 * All results are floor-rounded; nullopt reports inputs outside the money
 * range or a result that would leave it.
 */
class RewardCalculator {
public:
    /// feePercentage must be in 0..100
    explicit RewardCalculator(uint32_t feePercentage);

    uint32_t GetFeePercentage() const { return feePercentage_; }

    /// stake * accuracy / 100 + totalPool * accuracy / 10000
    std::optional<Amount> CalculateGrossReward(Score accuracy, Amount stake, Amount totalPool) const;

    /// gross * feePercentage / 100
    Amount CalculateProtocolFee(Amount gross) const;

    /// Complete payout for one claim
    std::optional<RewardBreakdown> Calculate(Score accuracy, Amount stake, Amount totalPool) const;

private:
    uint32_t feePercentage_;
};

} // namespace market
} // namespace foresight

#endif // FORESIGHT_MARKET_REWARD_H
