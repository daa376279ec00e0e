// FORESIGHT - Transition Script Replay
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Applies a script of market transitions to a controller and reports each
// outcome. Two replays of the same script into fresh stores end at the same
// digest.
//
// Script format, one command per line, '#' starts a comment:
//   fund <who> <amount>
//   create <who> <asset> <duration> <evaluation> <initial-price> <height>
//   submit <who> <asset> <round> <sentiment> <price> <stake> <height>
//   resolve <who> <asset> <round> <final-price> <height>
//   claim <who> <asset> <round> <height>
//   setminstake <who> <amount> <height>
//   setfee <who> <percent> <height>
//   phase <asset> <round> <height>
//   verify
// A principal is 40 hex characters or a name hashed into one. A sentiment is
// bearish, neutral, bullish or its wire value.

#ifndef FORESIGHT_MARKET_REPLAY_H
#define FORESIGHT_MARKET_REPLAY_H

#include "foresight/market/controller.h"
#include "foresight/market/ledger.h"
#include "foresight/market/store.h"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace foresight {
namespace market {

/// 40 hex characters are taken literally; anything else names a principal
Principal ParsePrincipal(const std::string& token);

/// Whitespace-separated tokens before any '#'
std::vector<std::string> TokenizeScriptLine(const std::string& line);

/// Process exit codes of a replay
enum class ReplayStatus {
    OK = 0,
    ScriptError = 1,
    DigestMismatch = 2,
};

// ============================================================================
// Ledger Persistence
// ============================================================================

/**
 * Restore a MemoryLedger from the snapshot kept beside the market state.
 *
 * A store without a snapshot must have an empty journal. A snapshot must
 * carry the sequence of the stored journal head; a mismatch means a run
 * stopped between a transition and its ledger save. Both cases return
 * Corruption and leave the ledger untouched.
 */
db::Status LoadLedger(const MarketStore& store, MemoryLedger& ledger);

/// Write the ledger, stamped with the current journal head sequence
db::Status SaveLedger(MarketStore& store, const MemoryLedger& ledger);

// ============================================================================
// ScriptReplayer
// ============================================================================

class ScriptReplayer {
public:
    /**
     * @param controller Initialized controller the commands run against
     * @param ledger The ledger the controller moves escrow through
     * @param out Receives one line per command and the final summary
     * @param ledgerStore When set, the ledger is saved there after each command
     */
    ScriptReplayer(RoundController& controller, MemoryLedger& ledger, std::ostream& out,
                   MarketStore* ledgerStore = nullptr);

    /**
     * Run one tokenized command and return its outcome: "OK", a rejection as
     * "<Error> (<Category>)", or the command's report.
     * Throws std::invalid_argument for a malformed command and
     * std::runtime_error when verification or the ledger save fails.
     */
    std::string Execute(const std::vector<std::string>& tokens);

    /// Execute every line. Stops at the first failing line and describes it
    /// as "<name>:<line>: <reason>" in error.
    bool Run(std::istream& in, const std::string& name, std::string& error);

    /// Print the totals, stats, escrow and digest. DigestMismatch when
    /// expectedDigest is set and differs from the final digest.
    ReplayStatus Finish(const std::string& expectedDigest);

    size_t Applied() const { return applied_; }
    size_t Rejected() const { return rejected_; }

private:
    RoundController& controller_;
    MemoryLedger& ledger_;
    std::ostream& out_;
    MarketStore* ledgerStore_;
    size_t applied_{0};
    size_t rejected_{0};
};

} // namespace market
} // namespace foresight

#endif // FORESIGHT_MARKET_REPLAY_H
