// FORESIGHT - Escrow Ledger Interface
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// The currency ledger holding market escrow. The engine only moves funds
// through this interface; token accounting lives with the host.

#ifndef FORESIGHT_MARKET_LEDGER_H
#define FORESIGHT_MARKET_LEDGER_H

#include "foresight/core/types.h"
#include "foresight/core/serialize.h"

#include <ios>
#include <map>
#include <mutex>
#include <string>

namespace foresight {
namespace market {

/**
 * External ledger holding the market's escrow account.
 */
class IEscrowLedger {
public:
    virtual ~IEscrowLedger() = default;

    /// Move amount from a principal into escrow; false if it cannot be taken
    virtual bool Lock(const Principal& from, Amount amount) = 0;

    /// Move amount from escrow to a principal; false if escrow cannot pay
    virtual bool Release(const Principal& to, Amount amount) = 0;

    /// Funds currently held in escrow
    virtual Amount EscrowBalance() const = 0;
};

/**
 * Balances and escrow of a MemoryLedger, stamped with the journal sequence
 * they correspond to.
 */
struct LedgerSnapshot {
    uint64_t journalSequence{0};
    Amount escrow{0};
    std::map<Principal, Amount> balances;
};

/**
 * In-process ledger with per-principal balances. Used by tests and the
 * replay tool.
 */
class MemoryLedger : public IEscrowLedger {
public:
    MemoryLedger() = default;

    bool Lock(const Principal& from, Amount amount) override;
    bool Release(const Principal& to, Amount amount) override;
    Amount EscrowBalance() const override;

    /// Mint funds to a principal
    bool Credit(const Principal& to, Amount amount);

    Amount BalanceOf(const Principal& who) const;

    /// Sum of all principal balances plus escrow
    Amount TotalSupply() const;

    /// Current balances and escrow; journalSequence is left at zero
    LedgerSnapshot Snapshot() const;

    /// Replace all balances and escrow; false (and no change) when the
    /// snapshot's total supply leaves the money range
    bool Restore(const LedgerSnapshot& snapshot);

    std::string ToString() const;

private:
    mutable std::mutex mutex_;
    std::map<Principal, Amount> balances_;
    Amount escrow_{0};
};

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const LedgerSnapshot& l) {
    Serialize(s, l.journalSequence);
    Serialize(s, l.escrow);
    WriteCompactSize(s, l.balances.size());
    for (const auto& [who, balance] : l.balances) {
        Serialize(s, who);
        Serialize(s, balance);
    }
}

/// Rejects amounts outside the money range and unordered or repeated principals
template<typename Stream>
void Unserialize(Stream& s, LedgerSnapshot& l) {
    Unserialize(s, l.journalSequence);
    Unserialize(s, l.escrow);
    if (!MoneyRange(l.escrow)) {
        throw std::ios_base::failure("escrow out of range");
    }
    uint64_t count = ReadCompactSize(s);
    l.balances.clear();
    for (uint64_t i = 0; i < count; ++i) {
        Principal who;
        Amount balance;
        Unserialize(s, who);
        Unserialize(s, balance);
        if (!MoneyRange(balance)) {
            throw std::ios_base::failure("balance out of range");
        }
        if (!l.balances.empty() && !(l.balances.rbegin()->first < who)) {
            throw std::ios_base::failure("ledger accounts out of order");
        }
        l.balances.emplace_hint(l.balances.end(), who, balance);
    }
}

} // namespace market
} // namespace foresight

#endif // FORESIGHT_MARKET_LEDGER_H
