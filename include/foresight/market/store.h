// FORESIGHT - Market State Store
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Typed persistence of market records over the ordered key-value database.
//
// Key layout (one prefix byte, see db::prefix):
//   R | asset | round id              -> Round
//   A | asset | round id              -> SentimentAggregate
//   P | asset | round id | principal  -> Prediction
//   U | principal                     -> Reputation
//   S                                 -> MarketStats
//   C                                 -> MarketParams
//   J | sequence                      -> JournalEntry
//   H                                 -> JournalHead
//   L                                 -> LedgerSnapshot (replay tool only)
// Assets are length-prefixed and integers big-endian, so a prefix scan
// returns a round's predictions in principal order and journal entries in
// sequence order.

#ifndef FORESIGHT_MARKET_STORE_H
#define FORESIGHT_MARKET_STORE_H

#include "foresight/db/database.h"
#include "foresight/market/journal.h"
#include "foresight/market/ledger.h"
#include "foresight/market/params.h"
#include "foresight/market/types.h"

#include <memory>
#include <string>
#include <vector>

namespace foresight {
namespace market {

// ============================================================================
// Key Encoding
// ============================================================================

std::string RoundKey(const AssetId& asset, RoundId id);
std::string AggregateKey(const AssetId& asset, RoundId id);
std::string PredictionKey(const AssetId& asset, RoundId id, const Principal& who);
/// Common prefix of all prediction keys of one round
std::string PredictionPrefix(const AssetId& asset, RoundId id);
std::string ReputationKey(const Principal& who);
std::string JournalKey(uint64_t sequence);

// ============================================================================
// StateBatch - Staged writes of one transition
// ============================================================================

/**
 * Collects the serialized records written by one market transition.
 * Nothing reaches the database until MarketStore::Commit.
 */
class StateBatch {
public:
    void PutRound(const Round& round);
    void PutAggregate(const AssetId& asset, RoundId id, const SentimentAggregate& agg);
    void PutPrediction(const AssetId& asset, RoundId id, const Prediction& prediction);
    void PutReputation(const Principal& who, const Reputation& rep);
    void PutStats(const MarketStats& stats);
    void PutParams(const MarketParams& params);
    void PutJournal(const JournalEntry& entry, const JournalHead& head);
    void PutLedger(const LedgerSnapshot& ledger);

    size_t Count() const { return batch_.Count(); }
    bool Empty() const { return batch_.Empty(); }
    void Clear() { batch_.Clear(); }

private:
    friend class MarketStore;
    db::WriteBatch batch_;
};

// ============================================================================
// MarketStore
// ============================================================================

/**
 * Market records over a db::Database.
 *
 * Read methods return NotFound for an absent record and Corruption for a
 * record that fails to decode; any other status comes from the database.
 */
class MarketStore {
public:
    explicit MarketStore(std::unique_ptr<db::Database> db,
                         const db::WriteOptions& writeOptions = db::WriteOptions());

    MarketStore(const MarketStore&) = delete;
    MarketStore& operator=(const MarketStore&) = delete;

    // ========================================================================
    // Reads
    // ========================================================================

    db::Status ReadRound(const AssetId& asset, RoundId id, Round& out) const;
    db::Status ReadAggregate(const AssetId& asset, RoundId id, SentimentAggregate& out) const;
    db::Status ReadPrediction(const AssetId& asset, RoundId id, const Principal& who,
                              Prediction& out) const;
    db::Status ReadReputation(const Principal& who, Reputation& out) const;
    db::Status ReadStats(MarketStats& out) const;
    db::Status ReadParams(MarketParams& out) const;
    db::Status ReadJournalEntry(uint64_t sequence, JournalEntry& out) const;
    db::Status ReadJournalHead(JournalHead& out) const;
    db::Status ReadLedger(LedgerSnapshot& out) const;

    /// All predictions of a round in key order
    db::Status ListPredictions(const AssetId& asset, RoundId id,
                               std::vector<Prediction>& out) const;

    // ========================================================================
    // Writes
    // ========================================================================

    /// Apply every staged write atomically
    db::Status Commit(StateBatch& batch);

    db::Database& GetDatabase() { return *db_; }

private:
    template<typename T>
    db::Status ReadRecord(const std::string& key, T& out) const;

    std::unique_ptr<db::Database> db_;
    db::WriteOptions writeOptions_;
};

} // namespace market
} // namespace foresight

#endif // FORESIGHT_MARKET_STORE_H
