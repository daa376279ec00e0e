// FORESIGHT - Market Parameters
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#ifndef FORESIGHT_MARKET_PARAMS_H
#define FORESIGHT_MARKET_PARAMS_H

#include "foresight/market/types.h"

#include <string>

namespace foresight {

namespace util {
class ConfigManager;
}

namespace market {

/**
 * Market-wide configuration. Persisted when the market is first initialized;
 * the persisted record wins over configuration on later starts.
 */
struct MarketParams {
    /// May resolve any round and change parameters
    Principal owner;
    Amount minimumStake{DEFAULT_MINIMUM_STAKE};
    /// Percentage of each gross reward retained in escrow, 0..100
    uint32_t feePercentage{DEFAULT_FEE_PERCENTAGE};

    /// Check ranges; on failure a reason is written to error if given
    bool Validate(std::string* error = nullptr) const;

    std::string ToString() const;
};

/// Whether a value is acceptable as the minimum stake
bool IsValidMinimumStake(Amount amount);

/// Whether a value is acceptable as the protocol fee percentage
inline bool IsValidFeePercentage(uint64_t percent) {
    return percent <= 100;
}

/**
 * Read owner, minstake and feepercent from configuration on top of the
 * values already in params.
 * @return false with a message in error if a value is malformed or out of range
 */
bool LoadMarketParams(const util::ConfigManager& config, MarketParams& params,
                      std::string& error);

template<typename Stream>
void Serialize(Stream& s, const MarketParams& p) {
    Serialize(s, p.owner);
    Serialize(s, p.minimumStake);
    Serialize(s, p.feePercentage);
}

template<typename Stream>
void Unserialize(Stream& s, MarketParams& p) {
    Unserialize(s, p.owner);
    Unserialize(s, p.minimumStake);
    Unserialize(s, p.feePercentage);
}

} // namespace market
} // namespace foresight

#endif // FORESIGHT_MARKET_PARAMS_H
