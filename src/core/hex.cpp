// FORESIGHT - Hex Encoding
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/core/hex.h"

namespace foresight {

namespace {

constexpr std::string_view DIGITS = "0123456789abcdef";

/// Value of one hex digit, or -1
int DigitValue(char c) {
    if (c >= 'A' && c <= 'F') {
        c = static_cast<char>(c - 'A' + 'a');
    }
    size_t pos = DIGITS.find(c);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

} // namespace

std::string HexStr(const uint8_t* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = DIGITS[data[i] >> 4];
        out[2 * i + 1] = DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::optional<std::vector<uint8_t>> ParseHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = DigitValue(hex[2 * i]);
        int lo = DigitValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out[i] = static_cast<uint8_t>(hi << 4 | lo);
    }
    return out;
}

} // namespace foresight
