// FORESIGHT - Reward Calculation Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/reward.h"
#include "foresight/core/arith.h"

#include <sstream>
#include <stdexcept>

namespace foresight {
namespace market {

std::string RewardBreakdown::ToString() const {
    std::ostringstream ss;
    ss << "RewardBreakdown {"
       << " accuracy: " << accuracy
       << ", base: " << baseReward
       << ", bonus: " << poolBonus
       << ", gross: " << grossReward
       << ", fee: " << protocolFee
       << ", net: " << netReward
       << ", correct: " << (isCorrect ? "yes" : "no")
       << " }";
    return ss.str();
}

RewardCalculator::RewardCalculator(uint32_t feePercentage)
    : feePercentage_(feePercentage) {
    if (feePercentage_ > 100) {
        throw std::invalid_argument("fee percentage must be in 0..100");
    }
}

std::optional<Amount> RewardCalculator::CalculateGrossReward(Score accuracy, Amount stake,
                                                             Amount totalPool) const {
    if (!MoneyRange(stake) || !MoneyRange(totalPool) || accuracy > 100) {
        return std::nullopt;
    }

    auto base = MulDivFloor(static_cast<uint64_t>(stake), accuracy, 100);
    auto bonus = MulDivFloor(static_cast<uint64_t>(totalPool), accuracy, 10000);
    if (!base || !bonus) {
        return std::nullopt;
    }
    auto gross = CheckedAdd(*base, *bonus);
    if (!gross || *gross > static_cast<uint64_t>(MAX_MONEY)) {
        return std::nullopt;
    }
    return static_cast<Amount>(*gross);
}

Amount RewardCalculator::CalculateProtocolFee(Amount gross) const {
    if (gross <= 0) {
        return 0;
    }
    // fee <= gross because feePercentage_ <= 100, so the result fits
    return static_cast<Amount>(*MulDivFloor(static_cast<uint64_t>(gross), feePercentage_, 100));
}

std::optional<RewardBreakdown> RewardCalculator::Calculate(Score accuracy, Amount stake,
                                                           Amount totalPool) const {
    auto gross = CalculateGrossReward(accuracy, stake, totalPool);
    if (!gross) {
        return std::nullopt;
    }

    RewardBreakdown result;
    result.accuracy = accuracy;
    result.baseReward = static_cast<Amount>(*MulDivFloor(static_cast<uint64_t>(stake), accuracy, 100));
    result.poolBonus = *gross - result.baseReward;
    result.grossReward = *gross;
    result.protocolFee = CalculateProtocolFee(*gross);
    result.netReward = *gross - result.protocolFee;
    result.isCorrect = IsCorrectPrediction(accuracy);
    return result;
}

} // namespace market
} // namespace foresight
