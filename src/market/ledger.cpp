// FORESIGHT - Escrow Ledger Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/ledger.h"
#include "foresight/util/logging.h"

#include <sstream>

namespace foresight {
namespace market {

bool MemoryLedger::Lock(const Principal& from, Amount amount) {
    if (amount <= 0 || !MoneyRange(amount)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Lock of " << amount << " from "
                                             << from.ToHex() << " refused: insufficient funds";
        return false;
    }
    if (!MoneyRange(escrow_ + amount)) {
        return false;
    }

    it->second -= amount;
    escrow_ += amount;
    return true;
}

bool MemoryLedger::Release(const Principal& to, Amount amount) {
    if (amount < 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (amount > escrow_) {
        LOG_WARN(util::LogCategory::LEDGER) << "Release of " << amount << " exceeds escrow "
                                            << escrow_;
        return false;
    }
    if (amount == 0) {
        return true;
    }

    escrow_ -= amount;
    balances_[to] += amount;
    return true;
}

Amount MemoryLedger::EscrowBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return escrow_;
}

bool MemoryLedger::Credit(const Principal& to, Amount amount) {
    if (amount <= 0 || !MoneyRange(amount)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Amount& balance = balances_[to];
    if (!MoneyRange(balance + amount)) {
        return false;
    }
    balance += amount;
    return true;
}

Amount MemoryLedger::BalanceOf(const Principal& who) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(who);
    return it == balances_.end() ? 0 : it->second;
}

Amount MemoryLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = escrow_;
    for (const auto& [who, balance] : balances_) {
        total += balance;
    }
    return total;
}

LedgerSnapshot MemoryLedger::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerSnapshot snapshot;
    snapshot.escrow = escrow_;
    snapshot.balances = balances_;
    return snapshot;
}

bool MemoryLedger::Restore(const LedgerSnapshot& snapshot) {
    if (!MoneyRange(snapshot.escrow)) {
        return false;
    }
    Amount total = snapshot.escrow;
    for (const auto& [who, balance] : snapshot.balances) {
        if (!MoneyRange(balance) || !MoneyRange(total + balance)) {
            LOG_ERROR(util::LogCategory::LEDGER) << "Ledger snapshot exceeds the money range at "
                                                 << who.ToHex();
            return false;
        }
        total += balance;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    balances_ = snapshot.balances;
    escrow_ = snapshot.escrow;
    return true;
}

std::string MemoryLedger::ToString() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream ss;
    ss << "MemoryLedger { accounts: " << balances_.size()
       << ", escrow: " << escrow_
       << " }";
    return ss.str();
}

} // namespace market
} // namespace foresight
