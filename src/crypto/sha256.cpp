// FORESIGHT - SHA256 Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace foresight {

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("SHA256: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("SHA256: EVP_DigestInit_ex failed");
    }
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(ctx_);
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

Hash256 SHA256::Finalize() {
    Hash256 digest;
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_, digest.data(), &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: EVP_DigestFinal_ex failed");
    }
    Reset();
    return digest;
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    return SHA256().Write(data, len).Finalize();
}

} // namespace foresight
