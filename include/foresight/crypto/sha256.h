// FORESIGHT - SHA256 Hash Function
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Incremental SHA-256 backed by the OpenSSL EVP digest interface.

#ifndef FORESIGHT_CRYPTO_SHA256_H
#define FORESIGHT_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "foresight/core/types.h"
#include "foresight/core/serialize.h"

struct evp_md_ctx_st;

namespace foresight {

/**
 * Incremental SHA-256 over an OpenSSL EVP context. Every member throws
 * std::runtime_error when OpenSSL reports a failure.
 */
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    SHA256& Write(const Byte* data, size_t len);

    /// Any Serialize-able value, in its stored encoding
    template<typename T>
    SHA256& WriteObject(const T& obj);

    /// Digest of everything written since construction or the last Finalize/Reset.
    /// The hasher starts over afterwards.
    Hash256 Finalize();

    /// Discard everything written so far
    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

template<typename T>
SHA256& SHA256::WriteObject(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return Write(ss.data(), ss.size());
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace foresight

#endif // FORESIGHT_CRYPTO_SHA256_H
