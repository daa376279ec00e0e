// FORESIGHT - Reputation Ledger Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/reputation.h"
#include "foresight/market/store.h"
#include "foresight/util/logging.h"

namespace foresight {
namespace market {

Reputation ApplyOutcome(const Reputation& current, bool isCorrect, Amount netEarnings) {
    Reputation next = current;
    ++next.totalPredictions;
    if (isCorrect) {
        ++next.correctPredictions;
    }
    next.totalEarnings += netEarnings;
    next.reputationScore = static_cast<Score>(next.correctPredictions * 100 / next.totalPredictions);
    return next;
}

std::optional<Reputation> ReputationLedger::Get(const Principal& who) const {
    Reputation rep;
    if (!store_.ReadReputation(who, rep).ok()) {
        return std::nullopt;
    }
    return rep;
}

Score ReputationLedger::GetScore(const Principal& who) const {
    auto rep = Get(who);
    return rep ? rep->reputationScore : DEFAULT_REPUTATION_SCORE;
}

std::optional<Reputation> ReputationLedger::Update(StateBatch& batch, const Principal& who,
                                                   bool isCorrect, Amount netEarnings) const {
    Reputation current;
    db::Status status = store_.ReadReputation(who, current);
    if (status.IsNotFound()) {
        current = Reputation();
    } else if (!status.ok()) {
        LOG_ERROR(util::LogCategory::MARKET) << "Cannot read reputation of " << who.ToHex()
                                             << ": " << status.ToString();
        return std::nullopt;
    }

    Reputation next = ApplyOutcome(current, isCorrect, netEarnings);
    batch.PutReputation(who, next);

    LOG_DEBUG(util::LogCategory::MARKET) << "Reputation " << who.ToHex() << " -> "
                                         << next.ToString();
    return next;
}

} // namespace market
} // namespace foresight
