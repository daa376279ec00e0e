// FORESIGHT - Market State Store Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/store.h"
#include "foresight/util/logging.h"

namespace foresight {
namespace market {

namespace {

void AppendBigEndian(std::string& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xff));
    }
}

std::string RoundScopedKey(char prefix, const AssetId& asset, RoundId id) {
    DataStream ss;
    Serialize(ss, asset);
    std::string key = db::MakeKey(prefix, db::Slice(ss.AsString()));
    AppendBigEndian(key, id);
    return key;
}

void AppendPrincipal(std::string& out, const Principal& who) {
    out.append(reinterpret_cast<const char*>(who.data()), who.size());
}

} // namespace

// ============================================================================
// Key Encoding
// ============================================================================

std::string RoundKey(const AssetId& asset, RoundId id) {
    return RoundScopedKey(db::prefix::ROUND, asset, id);
}

std::string AggregateKey(const AssetId& asset, RoundId id) {
    return RoundScopedKey(db::prefix::AGGREGATE, asset, id);
}

std::string PredictionPrefix(const AssetId& asset, RoundId id) {
    return RoundScopedKey(db::prefix::PREDICTION, asset, id);
}

std::string PredictionKey(const AssetId& asset, RoundId id, const Principal& who) {
    std::string key = PredictionPrefix(asset, id);
    AppendPrincipal(key, who);
    return key;
}

std::string ReputationKey(const Principal& who) {
    std::string key = db::MakeKey(db::prefix::REPUTATION);
    AppendPrincipal(key, who);
    return key;
}

std::string JournalKey(uint64_t sequence) {
    std::string key = db::MakeKey(db::prefix::JOURNAL);
    AppendBigEndian(key, sequence);
    return key;
}

// ============================================================================
// StateBatch
// ============================================================================

void StateBatch::PutRound(const Round& round) {
    batch_.Put(RoundKey(round.asset, round.id), db::SerializeToString(round));
}

void StateBatch::PutAggregate(const AssetId& asset, RoundId id, const SentimentAggregate& agg) {
    batch_.Put(AggregateKey(asset, id), db::SerializeToString(agg));
}

void StateBatch::PutPrediction(const AssetId& asset, RoundId id, const Prediction& prediction) {
    batch_.Put(PredictionKey(asset, id, prediction.predictor), db::SerializeToString(prediction));
}

void StateBatch::PutReputation(const Principal& who, const Reputation& rep) {
    batch_.Put(ReputationKey(who), db::SerializeToString(rep));
}

void StateBatch::PutStats(const MarketStats& stats) {
    batch_.Put(db::MakeKey(db::prefix::STATS), db::SerializeToString(stats));
}

void StateBatch::PutParams(const MarketParams& params) {
    batch_.Put(db::MakeKey(db::prefix::PARAMS), db::SerializeToString(params));
}

void StateBatch::PutJournal(const JournalEntry& entry, const JournalHead& head) {
    batch_.Put(JournalKey(entry.sequence), db::SerializeToString(entry));
    batch_.Put(db::MakeKey(db::prefix::JOURNAL_HEAD), db::SerializeToString(head));
}

void StateBatch::PutLedger(const LedgerSnapshot& ledger) {
    batch_.Put(db::MakeKey(db::prefix::LEDGER), db::SerializeToString(ledger));
}

// ============================================================================
// MarketStore
// ============================================================================

MarketStore::MarketStore(std::unique_ptr<db::Database> db, const db::WriteOptions& writeOptions)
    : db_(std::move(db)), writeOptions_(writeOptions) {}

template<typename T>
db::Status MarketStore::ReadRecord(const std::string& key, T& out) const {
    std::string value;
    db::Status status = db_->Get(db::Slice(key), &value);
    if (!status.ok()) {
        return status;
    }
    if (!db::DeserializeFromString(value, out)) {
        LOG_ERROR(util::LogCategory::DB) << "Undecodable record under key prefix '"
                                         << key[0] << "' (" << value.size() << " bytes)";
        return db::Status::Corruption("undecodable record");
    }
    return db::Status::Ok();
}

db::Status MarketStore::ReadRound(const AssetId& asset, RoundId id, Round& out) const {
    return ReadRecord(RoundKey(asset, id), out);
}

db::Status MarketStore::ReadAggregate(const AssetId& asset, RoundId id,
                                      SentimentAggregate& out) const {
    return ReadRecord(AggregateKey(asset, id), out);
}

db::Status MarketStore::ReadPrediction(const AssetId& asset, RoundId id, const Principal& who,
                                       Prediction& out) const {
    return ReadRecord(PredictionKey(asset, id, who), out);
}

db::Status MarketStore::ReadReputation(const Principal& who, Reputation& out) const {
    return ReadRecord(ReputationKey(who), out);
}

db::Status MarketStore::ReadStats(MarketStats& out) const {
    return ReadRecord(db::MakeKey(db::prefix::STATS), out);
}

db::Status MarketStore::ReadParams(MarketParams& out) const {
    return ReadRecord(db::MakeKey(db::prefix::PARAMS), out);
}

db::Status MarketStore::ReadJournalEntry(uint64_t sequence, JournalEntry& out) const {
    return ReadRecord(JournalKey(sequence), out);
}

db::Status MarketStore::ReadJournalHead(JournalHead& out) const {
    return ReadRecord(db::MakeKey(db::prefix::JOURNAL_HEAD), out);
}

db::Status MarketStore::ListPredictions(const AssetId& asset, RoundId id,
                                        std::vector<Prediction>& out) const {
    out.clear();
    std::string prefix = PredictionPrefix(asset, id);

    return db::ForEachWithPrefix(*db_, db::Slice(prefix),
        [&](const db::Slice&, const db::Slice& value) {
            Prediction prediction;
            if (!db::DeserializeFromString(value, prediction)) {
                LOG_ERROR(util::LogCategory::DB) << "Undecodable prediction in round "
                                                 << asset << "/" << id;
                return db::Status::Corruption("undecodable prediction");
            }
            out.push_back(prediction);
            return db::Status::Ok();
        });
}

db::Status MarketStore::ReadLedger(LedgerSnapshot& out) const {
    return ReadRecord(db::MakeKey(db::prefix::LEDGER), out);
}

db::Status MarketStore::Commit(StateBatch& batch) {
    if (batch.Empty()) {
        return db::Status::Ok();
    }
    db::Status status = db_->Write(writeOptions_, &batch.batch_);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Batch commit failed: " << status.ToString();
        return status;
    }
    LOG_TRACE(util::LogCategory::DB) << "Committed " << batch.Count() << " writes";
    batch.Clear();
    return status;
}

} // namespace market
} // namespace foresight
