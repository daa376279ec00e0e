// FORESIGHT - Reputation Ledger
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Per-principal track record. Purely cumulative: every claim adds one
// prediction, the score is correct * 100 / total.

#ifndef FORESIGHT_MARKET_REPUTATION_H
#define FORESIGHT_MARKET_REPUTATION_H

#include "foresight/market/types.h"

#include <optional>

namespace foresight {
namespace market {

class MarketStore;
class StateBatch;

/// Fold one claim outcome into a reputation record
Reputation ApplyOutcome(const Reputation& current, bool isCorrect, Amount netEarnings);

/**
 * Reads reputation records from the market store and stages updates into a
 * state batch. Owns no state of its own.
 */
class ReputationLedger {
public:
    explicit ReputationLedger(const MarketStore& store) : store_(store) {}

    /// Stored record; nullopt for a principal with no claims
    std::optional<Reputation> Get(const Principal& who) const;

    /// Stored score, or DEFAULT_REPUTATION_SCORE with no history
    Score GetScore(const Principal& who) const;

    /**
     * Apply a claim outcome and stage the new record into the batch.
     * @return The updated record, or nullopt if the stored record is unreadable
     */
    std::optional<Reputation> Update(StateBatch& batch, const Principal& who,
                                     bool isCorrect, Amount netEarnings) const;

private:
    const MarketStore& store_;
};

} // namespace market
} // namespace foresight

#endif // FORESIGHT_MARKET_REPUTATION_H
