// FORESIGHT - Transition Script Replay Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/replay.h"
#include "foresight/crypto/sha256.h"
#include "foresight/market/journal.h"
#include "foresight/util/logging.h"

#include <sstream>
#include <stdexcept>

namespace foresight {
namespace market {

namespace {

uint64_t ParseNumber(const std::string& token) {
    if (token.empty() || token[0] == '-') {
        throw std::invalid_argument("expected an unsigned number, got '" + token + "'");
    }
    size_t used = 0;
    uint64_t value = std::stoull(token, &used, 10);
    if (used != token.size()) {
        throw std::invalid_argument("trailing characters in '" + token + "'");
    }
    return value;
}

Amount ParseAmount(const std::string& token) {
    uint64_t value = ParseNumber(token);
    if (value > static_cast<uint64_t>(MAX_MONEY)) {
        throw std::invalid_argument("amount out of range: " + token);
    }
    return static_cast<Amount>(value);
}

uint8_t ParseSentimentToken(const std::string& token) {
    if (token == "bearish") return static_cast<uint8_t>(Sentiment::Bearish);
    if (token == "neutral") return static_cast<uint8_t>(Sentiment::Neutral);
    if (token == "bullish") return static_cast<uint8_t>(Sentiment::Bullish);
    uint64_t value = ParseNumber(token);
    if (value > 0xff) {
        throw std::invalid_argument("sentiment out of range: " + token);
    }
    return static_cast<uint8_t>(value);
}

void ExpectArgs(const std::vector<std::string>& tokens, size_t count) {
    if (tokens.size() != count + 1) {
        throw std::invalid_argument(tokens[0] + " takes " + std::to_string(count) +
                                    " arguments");
    }
}

db::Status ReadHeadSequence(const MarketStore& store, uint64_t& sequence) {
    JournalHead head;
    db::Status status = store.ReadJournalHead(head);
    if (status.IsNotFound()) {
        sequence = 0;
        return db::Status::Ok();
    }
    if (status.ok()) {
        sequence = head.sequence;
    }
    return status;
}

} // namespace

Principal ParsePrincipal(const std::string& token) {
    if (auto literal = Principal::TryFromHex(token)) {
        return *literal;
    }
    Hash256 digest = SHA256Hash(token);
    return Principal(digest.data(), Principal::SIZE);
}

std::vector<std::string> TokenizeScriptLine(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream ss(line.substr(0, line.find('#')));
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// ============================================================================
// Ledger Persistence
// ============================================================================

db::Status LoadLedger(const MarketStore& store, MemoryLedger& ledger) {
    uint64_t headSequence = 0;
    db::Status status = ReadHeadSequence(store, headSequence);
    if (!status.ok()) {
        return status;
    }

    LedgerSnapshot snapshot;
    status = store.ReadLedger(snapshot);
    if (status.IsNotFound()) {
        if (headSequence != 0) {
            return db::Status::Corruption("journal at sequence " + std::to_string(headSequence) +
                                          " has no ledger snapshot");
        }
        return db::Status::Ok();
    }
    if (!status.ok()) {
        return status;
    }

    if (snapshot.journalSequence != headSequence) {
        return db::Status::Corruption("ledger snapshot at sequence " +
                                      std::to_string(snapshot.journalSequence) +
                                      " does not match journal head " +
                                      std::to_string(headSequence));
    }
    if (!ledger.Restore(snapshot)) {
        return db::Status::Corruption("ledger snapshot exceeds the money range");
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Restored " << ledger.ToString()
                                        << " at sequence " << headSequence;
    return db::Status::Ok();
}

db::Status SaveLedger(MarketStore& store, const MemoryLedger& ledger) {
    LedgerSnapshot snapshot = ledger.Snapshot();
    db::Status status = ReadHeadSequence(store, snapshot.journalSequence);
    if (!status.ok()) {
        return status;
    }

    StateBatch batch;
    batch.PutLedger(snapshot);
    return store.Commit(batch);
}

// ============================================================================
// ScriptReplayer
// ============================================================================

ScriptReplayer::ScriptReplayer(RoundController& controller, MemoryLedger& ledger,
                               std::ostream& out, MarketStore* ledgerStore)
    : controller_(controller), ledger_(ledger), out_(out), ledgerStore_(ledgerStore) {}

std::string ScriptReplayer::Execute(const std::vector<std::string>& t) {
    if (t.empty()) {
        throw std::invalid_argument("empty command");
    }

    const std::string& cmd = t[0];
    MarketError result = MarketError::OK;
    std::ostringstream detail;

    if (cmd == "fund") {
        ExpectArgs(t, 2);
        Principal who = ParsePrincipal(t[1]);
        if (!ledger_.Credit(who, ParseAmount(t[2]))) {
            throw std::invalid_argument("cannot credit " + t[2]);
        }
        detail << "funded " << who.ToHex();
    } else if (cmd == "create") {
        ExpectArgs(t, 6);
        RoundId id = 0;
        result = controller_.CreateRound(ParsePrincipal(t[1]), t[2], ParseNumber(t[3]),
                                         ParseNumber(t[4]), ParseNumber(t[5]),
                                         ParseNumber(t[6]), id);
        if (result == MarketError::OK) detail << " round=" << id;
    } else if (cmd == "submit") {
        ExpectArgs(t, 7);
        result = controller_.SubmitPrediction(ParsePrincipal(t[1]), t[2], ParseNumber(t[3]),
                                              ParseSentimentToken(t[4]), ParseNumber(t[5]),
                                              ParseAmount(t[6]), ParseNumber(t[7]));
    } else if (cmd == "resolve") {
        ExpectArgs(t, 5);
        result = controller_.ResolveRound(ParsePrincipal(t[1]), t[2], ParseNumber(t[3]),
                                          ParseNumber(t[4]), ParseNumber(t[5]));
    } else if (cmd == "claim") {
        ExpectArgs(t, 4);
        ClaimReceipt receipt;
        result = controller_.ClaimReward(ParsePrincipal(t[1]), t[2], ParseNumber(t[3]),
                                         ParseNumber(t[4]), receipt);
        if (result == MarketError::OK) {
            detail << " accuracy=" << receipt.accuracyScore
                   << " reward=" << receipt.rewardAmount
                   << " fee=" << receipt.protocolFee
                   << " correct=" << (receipt.isCorrect ? 1 : 0);
        }
    } else if (cmd == "setminstake") {
        ExpectArgs(t, 3);
        result = controller_.SetMinimumStake(ParsePrincipal(t[1]), ParseAmount(t[2]),
                                             ParseNumber(t[3]));
    } else if (cmd == "setfee") {
        ExpectArgs(t, 3);
        uint64_t percent = ParseNumber(t[2]);
        if (percent > 0xffffffffULL) {
            throw std::invalid_argument("percent out of range: " + t[2]);
        }
        result = controller_.SetFeePercentage(ParsePrincipal(t[1]),
                                              static_cast<uint32_t>(percent),
                                              ParseNumber(t[3]));
    } else if (cmd == "phase") {
        ExpectArgs(t, 3);
        auto phase = controller_.GetRoundPhase(t[1], ParseNumber(t[2]), ParseNumber(t[3]));
        return phase ? RoundPhaseToString(*phase) : "NoRound";
    } else if (cmd == "verify") {
        ExpectArgs(t, 0);
        std::string error;
        if (!VerifyJournal(controller_.GetStore(), &error)) {
            throw std::runtime_error("journal verification failed: " + error);
        }
        return "journal ok";
    } else {
        throw std::invalid_argument("unknown command '" + cmd + "'");
    }

    if (ledgerStore_) {
        db::Status status = SaveLedger(*ledgerStore_, ledger_);
        if (!status.ok()) {
            throw std::runtime_error("cannot save ledger: " + status.ToString());
        }
    }

    if (cmd == "fund") {
        return detail.str();
    }
    if (result == MarketError::OK) {
        ++applied_;
        return "OK" + detail.str();
    }
    ++rejected_;
    return std::string(MarketErrorToString(result)) + " (" +
           ErrorCategoryToString(GetErrorCategory(result)) + ")";
}

bool ScriptReplayer::Run(std::istream& in, const std::string& name, std::string& error) {
    std::string line;
    int lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        auto tokens = TokenizeScriptLine(line);
        if (tokens.empty()) {
            continue;
        }
        try {
            std::string outcome = Execute(tokens);
            out_ << lineNumber << ": " << tokens[0] << " -> " << outcome << "\n";
        } catch (const std::exception& e) {
            error = name + ":" + std::to_string(lineNumber) + ": " + e.what();
            LOG_ERROR(util::LogCategory::REPLAY) << error;
            return false;
        }
    }
    return true;
}

ReplayStatus ScriptReplayer::Finish(const std::string& expectedDigest) {
    MarketStats stats = controller_.GetMarketStats();
    std::string digest = controller_.GetStateDigest().ToHex();

    out_ << "applied=" << applied_ << " rejected=" << rejected_ << "\n"
         << stats.ToString() << "\n"
         << "escrow=" << ledger_.EscrowBalance() << "\n"
         << "digest=" << digest << std::endl;

    if (!expectedDigest.empty() && expectedDigest != digest) {
        LOG_ERROR(util::LogCategory::REPLAY) << "Digest mismatch: expected " << expectedDigest
                                             << ", got " << digest;
        return ReplayStatus::DigestMismatch;
    }
    return ReplayStatus::OK;
}

} // namespace market
} // namespace foresight
