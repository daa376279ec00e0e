// FORESIGHT - Core Types
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Amounts, heights and the fixed-width identifiers shared by every module.

#ifndef FORESIGHT_CORE_TYPES_H
#define FORESIGHT_CORE_TYPES_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace foresight {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;

/// Staked currency in the ledger's smallest unit
using Amount = int64_t;

/// Block height supplied by the host chain
using Height = uint64_t;

constexpr Amount COIN = 100000000LL;
constexpr Amount MAX_MONEY = 21000000000LL * COIN;

inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Fixed-Width Identifiers
// ============================================================================

/**
 * BITS/8 opaque bytes, compared and hex-printed in storage order.
 * All zero is the null value.
 */
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept { data_.fill(0); }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}

    /// Copies the first min(len, SIZE) bytes; the rest stay zero
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data != nullptr) {
            std::copy(data, data + std::min(len, SIZE), data_.begin());
        }
    }

    bool IsNull() const noexcept {
        return std::all_of(data_.begin(), data_.end(), [](Byte b) { return b == 0; });
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    bool operator==(const BaseHash& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const BaseHash& other) const noexcept { return data_ != other.data_; }

    /// Byte-lexicographic, the order of encoded store keys
    bool operator<(const BaseHash& other) const noexcept { return data_ < other.data_; }

    std::string ToHex() const;

    /// Exactly 2*SIZE hex digits, else nullopt
    static std::optional<BaseHash> TryFromHex(std::string_view hex);

    /// As TryFromHex; throws std::invalid_argument on bad input
    static BaseHash FromHex(std::string_view hex);

private:
    std::array<Byte, SIZE> data_;
};

/// SHA-256 digests (journal chain, state digest)
using Hash256 = BaseHash<256>;

/// 160-bit identifiers
using Hash160 = BaseHash<160>;

/// An already-authenticated caller identity
using Principal = Hash160;

extern template class BaseHash<256>;
extern template class BaseHash<160>;

} // namespace foresight

#endif // FORESIGHT_CORE_TYPES_H
