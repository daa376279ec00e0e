// FORESIGHT - Checked Integer Arithmetic
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Helpers for the fixed-point market math. Products are formed in 128-bit
// unsigned arithmetic so that a*b never wraps before the division.

#ifndef FORESIGHT_CORE_ARITH_H
#define FORESIGHT_CORE_ARITH_H

#include <cstdint>
#include <limits>
#include <optional>

namespace foresight {

/// floor(a * b / d). Returns nullopt when d == 0 or the result exceeds 64 bits.
inline std::optional<uint64_t> MulDivFloor(uint64_t a, uint64_t b, uint64_t d) {
    if (d == 0) {
        return std::nullopt;
    }
    __uint128_t result = static_cast<__uint128_t>(a) * b / d;
    if (result > std::numeric_limits<uint64_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(result);
}

/// a + b, or nullopt on unsigned overflow
inline std::optional<uint64_t> CheckedAdd(uint64_t a, uint64_t b) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        return std::nullopt;
    }
    return a + b;
}

/// |a - b| without going through a signed type
inline uint64_t AbsDiff(uint64_t a, uint64_t b) {
    return a >= b ? a - b : b - a;
}

} // namespace foresight

#endif // FORESIGHT_CORE_ARITH_H
