// FORESIGHT - Transition Journal Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/market/journal.h"
#include "foresight/market/store.h"
#include "foresight/crypto/sha256.h"
#include "foresight/util/logging.h"

#include <sstream>

namespace foresight {
namespace market {

const char* TransitionKindToString(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::CreateRound:      return "CreateRound";
        case TransitionKind::SubmitPrediction: return "SubmitPrediction";
        case TransitionKind::ResolveRound:     return "ResolveRound";
        case TransitionKind::ClaimReward:      return "ClaimReward";
        case TransitionKind::SetMinimumStake:  return "SetMinimumStake";
        case TransitionKind::SetFeePercentage: return "SetFeePercentage";
        default:                               return "Unknown";
    }
}

std::string JournalEntry::ToString() const {
    std::ostringstream ss;
    ss << "JournalEntry { seq: " << sequence
       << ", kind: " << TransitionKindToString(kind)
       << ", asset: " << asset
       << ", round: " << roundId
       << ", actor: " << actor.ToHex()
       << ", height: " << height
       << ", args: [";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << args[i];
    }
    ss << "], digest: " << digest.ToHex() << " }";
    return ss.str();
}

Hash256 ComputeEntryDigest(const Hash256& previous, const JournalEntry& entry) {
    DataStream body;
    SerializeEntryBody(body, entry);
    return SHA256().WriteObject(previous).Write(body.data(), body.size()).Finalize();
}

JournalHead ChainEntry(const JournalHead& head, JournalEntry& entry) {
    entry.sequence = head.sequence + 1;
    entry.digest = ComputeEntryDigest(head.digest, entry);

    JournalHead next;
    next.sequence = entry.sequence;
    next.digest = entry.digest;
    return next;
}

bool VerifyJournal(const MarketStore& store, std::string* error) {
    auto fail = [error](const std::string& msg) {
        LOG_ERROR(util::LogCategory::JOURNAL) << "Journal verification failed: " << msg;
        if (error) *error = msg;
        return false;
    };

    JournalHead head;
    db::Status status = store.ReadJournalHead(head);
    if (status.IsNotFound()) {
        return true;
    }
    if (!status.ok()) {
        return fail("cannot read head: " + status.ToString());
    }

    Hash256 running;
    for (uint64_t seq = 1; seq <= head.sequence; ++seq) {
        JournalEntry entry;
        status = store.ReadJournalEntry(seq, entry);
        if (!status.ok()) {
            return fail("entry " + std::to_string(seq) + ": " + status.ToString());
        }
        if (entry.sequence != seq) {
            return fail("entry " + std::to_string(seq) + " carries sequence " +
                        std::to_string(entry.sequence));
        }
        running = ComputeEntryDigest(running, entry);
        if (running != entry.digest) {
            return fail("digest mismatch at entry " + std::to_string(seq));
        }
    }

    if (running != head.digest) {
        return fail("head digest does not match last entry");
    }

    LOG_DEBUG(util::LogCategory::JOURNAL) << "Verified " << head.sequence << " journal entries";
    return true;
}

} // namespace market
} // namespace foresight
