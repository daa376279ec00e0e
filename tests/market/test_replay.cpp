// FORESIGHT - Transition Script Replay Tests
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include <gtest/gtest.h>
#include "foresight/market/replay.h"
#include "foresight/util/logging.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace foresight {
namespace market {
namespace test {

namespace {

/// Forwards to a database shared between simulated process runs
class SharedDatabase : public db::Database {
public:
    explicit SharedDatabase(std::shared_ptr<db::Database> inner) : inner_(std::move(inner)) {}

    db::Status Get(const db::ReadOptions& options, const db::Slice& key,
                   std::string* value) override {
        return inner_->Get(options, key, value);
    }
    db::Status Put(const db::WriteOptions& options, const db::Slice& key,
                   const db::Slice& value) override {
        return inner_->Put(options, key, value);
    }
    db::Status Delete(const db::WriteOptions& options, const db::Slice& key) override {
        return inner_->Delete(options, key);
    }
    db::Status Write(const db::WriteOptions& options, db::WriteBatch* batch) override {
        return inner_->Write(options, batch);
    }
    std::unique_ptr<db::Iterator> NewIterator(const db::ReadOptions& options) override {
        return inner_->NewIterator(options);
    }

private:
    std::shared_ptr<db::Database> inner_;
};

const char* const ROUND_SCRIPT =
    "# one round, two principals\n"
    "fund alice 10000000\n"
    "create owner BTC 10 5 100 100\n"
    "submit alice BTC 1 bullish 120 1000000 102\n"
    "submit bob BTC 1 bullish 120 10 103   # under the minimum stake\n"
    "phase BTC 1 111\n"
    "resolve owner BTC 1 130 115\n"
    "claim alice BTC 1 116\n"
    "phase BTC 1 116\n"
    "verify\n";

} // namespace

/// One run of the tool: its own ledger, store handle and controller
struct ReplaySession {
    std::shared_ptr<MemoryLedger> ledger;
    MarketStore* store{nullptr};
    std::unique_ptr<RoundController> controller;
    std::ostringstream out;
};

class ScriptReplayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::Logger::Instance().ClearSinks();
        database_ = std::shared_ptr<db::Database>(db::OpenMemoryDatabase());
        defaults_.owner = ParsePrincipal("owner");
    }

    std::unique_ptr<ReplaySession> Open(std::shared_ptr<db::Database> database) {
        auto session = std::make_unique<ReplaySession>();
        session->ledger = std::make_shared<MemoryLedger>();
        auto store = std::make_unique<MarketStore>(std::make_unique<SharedDatabase>(database));
        session->store = store.get();
        session->controller = std::make_unique<RoundController>(std::move(store),
                                                                session->ledger, defaults_);
        EXPECT_EQ(session->controller->Initialize(), MarketError::OK);
        return session;
    }

    std::unique_ptr<ReplaySession> Open() { return Open(database_); }

    /// Run a script; the ledger is persisted when persist is set
    bool Run(ReplaySession& session, const std::string& script, bool persist,
             std::string* error = nullptr) {
        ScriptReplayer replayer(*session.controller, *session.ledger, session.out,
                                persist ? session.store : nullptr);
        std::istringstream in(script);
        std::string message;
        bool ok = replayer.Run(in, "script", message);
        if (error) *error = message;
        return ok;
    }

    static bool Contains(const std::string& text, const std::string& needle) {
        return text.find(needle) != std::string::npos;
    }

    std::shared_ptr<db::Database> database_;
    MarketParams defaults_;
};

// ============================================================================
// Script Parsing
// ============================================================================

TEST(ScriptParsingTest, TokenizeDropsComments) {
    EXPECT_EQ(TokenizeScriptLine("  claim alice BTC 1 116  # payout"),
              (std::vector<std::string>{"claim", "alice", "BTC", "1", "116"}));
    EXPECT_TRUE(TokenizeScriptLine("# only a comment").empty());
    EXPECT_TRUE(TokenizeScriptLine("   ").empty());
}

TEST(ScriptParsingTest, PrincipalFromHexOrName) {
    const std::string hex = "00112233445566778899aabbccddeeff01234567";
    EXPECT_EQ(ParsePrincipal(hex).ToHex(), hex);

    Principal alice = ParsePrincipal("alice");
    EXPECT_EQ(alice, ParsePrincipal("alice"));
    EXPECT_NE(alice, ParsePrincipal("bob"));
    EXPECT_FALSE(alice.IsNull());
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(ScriptReplayerTest, RunsFullRound) {
    auto session = Open();
    std::string error;
    ASSERT_TRUE(Run(*session, ROUND_SCRIPT, false, &error)) << error;

    const std::string out = session->out.str();
    EXPECT_TRUE(Contains(out, "2: fund -> funded " + ParsePrincipal("alice").ToHex()));
    EXPECT_TRUE(Contains(out, "3: create -> OK round=1"));
    EXPECT_TRUE(Contains(out, "4: submit -> OK\n"));
    EXPECT_TRUE(Contains(out, "5: submit -> InsufficientStake (Validation)"));
    EXPECT_TRUE(Contains(out, "6: phase -> AwaitingResolution"));
    EXPECT_TRUE(Contains(out, "7: resolve -> OK"));
    EXPECT_TRUE(Contains(out, "8: claim -> OK accuracy=96 reward=921120 fee=48480 correct=1"));
    EXPECT_TRUE(Contains(out, "9: phase -> Resolved"));
    EXPECT_TRUE(Contains(out, "10: verify -> journal ok"));

    EXPECT_EQ(session->ledger->EscrowBalance(), 1000000 - 921120);
    EXPECT_EQ(session->ledger->BalanceOf(ParsePrincipal("alice")), 9000000 + 921120);
}

TEST_F(ScriptReplayerTest, CountsAppliedAndRejected) {
    auto session = Open();
    ScriptReplayer replayer(*session->controller, *session->ledger, session->out);
    std::istringstream in(ROUND_SCRIPT);
    std::string error;
    ASSERT_TRUE(replayer.Run(in, "script", error)) << error;

    EXPECT_EQ(replayer.Applied(), 4u);
    EXPECT_EQ(replayer.Rejected(), 1u);
    EXPECT_EQ(replayer.Finish(""), ReplayStatus::OK);
    EXPECT_TRUE(Contains(session->out.str(), "applied=4 rejected=1\n"));
    EXPECT_TRUE(Contains(session->out.str(), "escrow=78880\n"));
}

TEST_F(ScriptReplayerTest, SentimentWordsAndWireValues) {
    auto session = Open();
    std::string error;
    ASSERT_TRUE(Run(*session,
                    "fund alice 5000000\n"
                    "fund bob 5000000\n"
                    "create owner ETH 10 5 100 100\n"
                    "submit alice ETH 1 1 90 1000000 101\n"
                    "submit bob ETH 1 7 90 1000000 101\n",
                    false, &error)) << error;

    const std::string out = session->out.str();
    EXPECT_TRUE(Contains(out, "4: submit -> OK"));
    EXPECT_TRUE(Contains(out, "5: submit -> InvalidSentiment (Validation)"));

    auto aggregate = session->controller->GetAggregate("ETH", 1);
    ASSERT_TRUE(aggregate.has_value());
    EXPECT_EQ(aggregate->bearishCount, 1u);
}

TEST_F(ScriptReplayerTest, MalformedLineStopsRun) {
    auto session = Open();
    std::string error;
    EXPECT_FALSE(Run(*session, "fund alice 5000000\nsubmit alice BTC 1\nverify\n", false, &error));
    EXPECT_EQ(error, "script:2: submit takes 7 arguments");
    EXPECT_FALSE(Contains(session->out.str(), "verify"));

    EXPECT_FALSE(Run(*session, "bogus 1 2\n", false, &error));
    EXPECT_EQ(error, "script:1: unknown command 'bogus'");

    EXPECT_FALSE(Run(*session, "fund alice -5\n", false, &error));
    EXPECT_EQ(error, "script:1: expected an unsigned number, got '-5'");

    EXPECT_FALSE(Run(*session, "create owner BTC 10 5 100 1x\n", false, &error));
    EXPECT_EQ(error, "script:1: trailing characters in '1x'");
}

// ============================================================================
// Digest
// ============================================================================

TEST_F(ScriptReplayerTest, FreshStoresReachSameDigest) {
    auto first = Open();
    auto second = Open(std::shared_ptr<db::Database>(db::OpenMemoryDatabase()));
    ASSERT_TRUE(Run(*first, ROUND_SCRIPT, false));
    ASSERT_TRUE(Run(*second, ROUND_SCRIPT, false));

    EXPECT_EQ(first->controller->GetStateDigest(), second->controller->GetStateDigest());
    EXPECT_FALSE(first->controller->GetStateDigest().IsNull());
}

TEST_F(ScriptReplayerTest, ExpectedDigestMismatch) {
    auto session = Open();
    ASSERT_TRUE(Run(*session, ROUND_SCRIPT, false));
    const std::string digest = session->controller->GetStateDigest().ToHex();

    ScriptReplayer replayer(*session->controller, *session->ledger, session->out);
    EXPECT_EQ(replayer.Finish(digest), ReplayStatus::OK);
    EXPECT_EQ(replayer.Finish(std::string(64, '0')), ReplayStatus::DigestMismatch);
    EXPECT_EQ(static_cast<int>(ReplayStatus::DigestMismatch), 2);
    EXPECT_TRUE(Contains(session->out.str(), "digest=" + digest));
}

// ============================================================================
// Ledger Persistence
// ============================================================================

TEST_F(ScriptReplayerTest, LedgerCarriesEscrowAcrossRuns) {
    auto first = Open();
    ASSERT_TRUE(Run(*first,
                    "fund alice 10000000\n"
                    "create owner BTC 10 5 100 100\n"
                    "submit alice BTC 1 bullish 120 1000000 102\n",
                    true));
    first.reset();

    auto second = Open();
    ASSERT_TRUE(LoadLedger(*second->store, *second->ledger).ok());
    EXPECT_EQ(second->ledger->EscrowBalance(), 1000000);
    EXPECT_EQ(second->ledger->BalanceOf(ParsePrincipal("alice")), 9000000);

    std::string error;
    ASSERT_TRUE(Run(*second, "resolve owner BTC 1 130 115\nclaim alice BTC 1 116\n", true, &error))
        << error;
    EXPECT_TRUE(Contains(second->out.str(), "2: claim -> OK accuracy=96 reward=921120"));
    EXPECT_EQ(second->ledger->EscrowBalance(), 78880);
    second.reset();

    auto third = Open();
    ASSERT_TRUE(LoadLedger(*third->store, *third->ledger).ok());
    EXPECT_EQ(third->ledger->EscrowBalance(), 78880);
    EXPECT_EQ(third->ledger->BalanceOf(ParsePrincipal("alice")), 9000000 + 921120);
}

TEST_F(ScriptReplayerTest, FreshStoreLoadsEmptyLedger) {
    auto session = Open();
    ASSERT_TRUE(LoadLedger(*session->store, *session->ledger).ok());
    EXPECT_EQ(session->ledger->TotalSupply(), 0);
}

TEST_F(ScriptReplayerTest, JournalWithoutLedgerRefused) {
    auto first = Open();
    ASSERT_TRUE(Run(*first, "create owner BTC 10 5 100 100\n", false));
    first.reset();

    auto second = Open();
    ASSERT_TRUE(second->ledger->Credit(ParsePrincipal("carol"), 5));
    db::Status status = LoadLedger(*second->store, *second->ledger);
    EXPECT_TRUE(status.IsCorruption()) << status.ToString();
    EXPECT_EQ(second->ledger->TotalSupply(), 5);
}

TEST_F(ScriptReplayerTest, StaleLedgerRefused) {
    auto first = Open();
    ASSERT_TRUE(Run(*first, "fund alice 10000000\ncreate owner BTC 10 5 100 100\n", true));
    // Transition committed without a ledger save
    ASSERT_TRUE(Run(*first, "create owner ETH 10 5 100 100\n", false));
    first.reset();

    auto second = Open();
    db::Status status = LoadLedger(*second->store, *second->ledger);
    EXPECT_TRUE(status.IsCorruption());
    EXPECT_EQ(status.message(), "ledger snapshot at sequence 1 does not match journal head 2");
    EXPECT_EQ(second->ledger->EscrowBalance(), 0);
}

} // namespace test
} // namespace market
} // namespace foresight
