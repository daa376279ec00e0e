// FORESIGHT - SHA256 Tests
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include <gtest/gtest.h>
#include "foresight/crypto/sha256.h"
#include "foresight/core/types.h"

#include <string>
#include <vector>

namespace foresight {
namespace test {

// ============================================================================
// Helper Functions
// ============================================================================

std::string HashHex(const std::string& input) {
    return SHA256Hash(input).ToHex();
}

std::string FinalizeHex(SHA256& hasher) {
    return hasher.Finalize().ToHex();
}

// ============================================================================
// Standard Vectors
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(HashHex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, ABCString) {
    EXPECT_EQ(HashHex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockInput) {
    EXPECT_EQ(HashHex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, QuickBrownFox) {
    EXPECT_EQ(HashHex("The quick brown fox jumps over the lazy dog"),
              "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

TEST(SHA256Test, MillionA) {
    EXPECT_EQ(HashHex(std::string(1000000, 'a')),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, IncrementalMatchesSingleCall) {
    const std::string message = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";

    SHA256 hasher;
    for (char c : message) {
        Byte b = static_cast<Byte>(c);
        hasher.Write(&b, 1);
    }
    EXPECT_EQ(FinalizeHex(hasher), HashHex(message));
}

TEST(SHA256Test, ChainedWrites) {
    const Byte ab[] = {'a', 'b'};
    const Byte c[] = {'c'};

    SHA256 hasher;
    hasher.Write(ab, sizeof(ab)).Write(c, sizeof(c));
    EXPECT_EQ(FinalizeHex(hasher),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, ResetStartsOver) {
    const Byte junk[] = {1, 2, 3};
    const Byte abc[] = {'a', 'b', 'c'};

    SHA256 hasher;
    hasher.Write(junk, sizeof(junk));
    hasher.Reset();
    hasher.Write(abc, sizeof(abc));
    EXPECT_EQ(FinalizeHex(hasher), HashHex("abc"));

    hasher.Reset();
    EXPECT_EQ(FinalizeHex(hasher), HashHex(""));
}

TEST(SHA256Test, FinalizeStartsOver) {
    const Byte abc[] = {'a', 'b', 'c'};

    SHA256 hasher;
    hasher.Write(abc, sizeof(abc));
    EXPECT_EQ(FinalizeHex(hasher), HashHex("abc"));
    EXPECT_EQ(FinalizeHex(hasher), HashHex(""));
}

TEST(SHA256Test, WriteObjectHashesStoredEncoding) {
    Hash160 who;
    who[0] = 0x42;
    uint64_t height = 7;

    DataStream ss;
    Serialize(ss, who);
    Serialize(ss, height);

    SHA256 hasher;
    hasher.WriteObject(who).WriteObject(height);
    EXPECT_EQ(hasher.Finalize(), SHA256Hash(ss.data(), ss.size()));
}

TEST(SHA256Test, VectorOverload) {
    std::vector<Byte> data = {'a', 'b', 'c'};
    EXPECT_EQ(SHA256Hash(data), SHA256Hash(std::string("abc")));
}

} // namespace test
} // namespace foresight
