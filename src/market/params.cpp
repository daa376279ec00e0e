// FORESIGHT - Market Parameters Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/params.h"
#include "foresight/util/config.h"
#include "foresight/util/logging.h"

#include <sstream>
#include <stdexcept>

namespace foresight {
namespace market {

bool IsValidMinimumStake(Amount amount) {
    return amount > 0 && MoneyRange(amount);
}

bool MarketParams::Validate(std::string* error) const {
    if (!IsValidMinimumStake(minimumStake)) {
        if (error) *error = "minimum stake out of range";
        return false;
    }
    if (!IsValidFeePercentage(feePercentage)) {
        if (error) *error = "fee percentage must be in 0..100";
        return false;
    }
    return true;
}

std::string MarketParams::ToString() const {
    std::ostringstream ss;
    ss << "MarketParams { owner: " << owner.ToHex()
       << ", minStake: " << minimumStake
       << ", fee: " << feePercentage << "%"
       << " }";
    return ss.str();
}

bool LoadMarketParams(const util::ConfigManager& config, MarketParams& params,
                      std::string& error) {
    using util::ConfigKeys::OWNER;
    using util::ConfigKeys::MINSTAKE;
    using util::ConfigKeys::FEEPERCENT;

    MarketParams result = params;

    if (auto owner = config.TryGetString(OWNER)) {
        try {
            result.owner = Principal::FromHex(*owner);
        } catch (const std::invalid_argument& e) {
            error = std::string("invalid -") + OWNER + ": " + e.what();
            return false;
        }
    }

    if (config.HasKey(MINSTAKE)) {
        auto value = config.TryGetInt(MINSTAKE);
        if (!value || !IsValidMinimumStake(*value)) {
            error = std::string("invalid -") + MINSTAKE + ": " +
                    config.GetString(MINSTAKE, "");
            return false;
        }
        result.minimumStake = *value;
    }

    if (config.HasKey(FEEPERCENT)) {
        auto value = config.TryGetUInt(FEEPERCENT);
        if (!value || !IsValidFeePercentage(*value)) {
            error = std::string("invalid -") + FEEPERCENT + ": " +
                    config.GetString(FEEPERCENT, "") + " (must be 0..100)";
            return false;
        }
        result.feePercentage = static_cast<uint32_t>(*value);
    }

    if (result.owner.IsNull()) {
        LOG_WARN(util::LogCategory::CONFIG) << "No market owner configured; "
                                            << "only round creators can resolve";
    }

    params = result;
    return true;
}

} // namespace market
} // namespace foresight
