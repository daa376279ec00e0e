// FORESIGHT - Transition Journal
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Append-only record of committed market transitions. Each entry is chained
// to its predecessor: digest = SHA256(previous digest || entry body), so the
// head digest commits to the complete transition history.

#ifndef FORESIGHT_MARKET_JOURNAL_H
#define FORESIGHT_MARKET_JOURNAL_H

#include "foresight/market/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace foresight {
namespace market {

class MarketStore;

enum class TransitionKind : uint8_t {
    CreateRound = 1,
    SubmitPrediction = 2,
    ResolveRound = 3,
    ClaimReward = 4,
    SetMinimumStake = 5,
    SetFeePercentage = 6,
};

const char* TransitionKindToString(TransitionKind kind);

/**
 * One committed transition.
 *
 * Argument layout by kind:
 *   CreateRound       duration, evaluation, initial price
 *   SubmitPrediction  sentiment, predicted price, stake
 *   ResolveRound      final price
 *   ClaimReward       accuracy, net reward, protocol fee
 *   SetMinimumStake   amount
 *   SetFeePercentage  percent
 */
struct JournalEntry {
    uint64_t sequence{0};
    TransitionKind kind{TransitionKind::CreateRound};
    AssetId asset;
    RoundId roundId{0};
    Principal actor;
    Height height{0};
    std::vector<uint64_t> args;
    /// Chained digest through this entry
    Hash256 digest;

    std::string ToString() const;
};

/// Latest journal position; sequence 0 with a null digest when empty
struct JournalHead {
    uint64_t sequence{0};
    Hash256 digest;

    bool IsEmpty() const { return sequence == 0; }
};

/// SHA256(previous || body(entry)); the entry's own digest field is ignored
Hash256 ComputeEntryDigest(const Hash256& previous, const JournalEntry& entry);

/// Fill in sequence and digest so the entry follows head, and return the new head
JournalHead ChainEntry(const JournalHead& head, JournalEntry& entry);

/**
 * Walk the stored journal from the first entry and recompute every digest.
 * @return true when the chain is intact and ends at the stored head
 */
bool VerifyJournal(const MarketStore& store, std::string* error = nullptr);

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, TransitionKind kind) {
    Serialize(s, static_cast<uint8_t>(kind));
}

template<typename Stream>
void Unserialize(Stream& s, TransitionKind& kind) {
    uint8_t raw;
    Unserialize(s, raw);
    if (raw < static_cast<uint8_t>(TransitionKind::CreateRound) ||
        raw > static_cast<uint8_t>(TransitionKind::SetFeePercentage)) {
        throw std::ios_base::failure("invalid transition kind");
    }
    kind = static_cast<TransitionKind>(raw);
}

/// Entry fields covered by the digest
template<typename Stream>
void SerializeEntryBody(Stream& s, const JournalEntry& e) {
    Serialize(s, e.sequence);
    Serialize(s, e.kind);
    Serialize(s, e.asset);
    Serialize(s, e.roundId);
    Serialize(s, e.actor);
    Serialize(s, e.height);
    WriteCompactSize(s, e.args.size());
    for (uint64_t arg : e.args) {
        Serialize(s, arg);
    }
}

template<typename Stream>
void Serialize(Stream& s, const JournalEntry& e) {
    SerializeEntryBody(s, e);
    Serialize(s, e.digest);
}

template<typename Stream>
void Unserialize(Stream& s, JournalEntry& e) {
    Unserialize(s, e.sequence);
    Unserialize(s, e.kind);
    Unserialize(s, e.asset);
    Unserialize(s, e.roundId);
    Unserialize(s, e.actor);
    Unserialize(s, e.height);
    uint64_t count = ReadCompactSize(s);
    e.args.clear();
    for (uint64_t i = 0; i < count; ++i) {
        uint64_t arg;
        Unserialize(s, arg);
        e.args.push_back(arg);
    }
    Unserialize(s, e.digest);
}

template<typename Stream>
void Serialize(Stream& s, const JournalHead& h) {
    Serialize(s, h.sequence);
    Serialize(s, h.digest);
}

template<typename Stream>
void Unserialize(Stream& s, JournalHead& h) {
    Unserialize(s, h.sequence);
    Unserialize(s, h.digest);
}

} // namespace market
} // namespace foresight

#endif // FORESIGHT_MARKET_JOURNAL_H
