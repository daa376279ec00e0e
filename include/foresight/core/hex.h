// FORESIGHT - Hex Encoding
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#ifndef FORESIGHT_CORE_HEX_H
#define FORESIGHT_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace foresight {

/// Lowercase hex of len bytes
std::string HexStr(const uint8_t* data, size_t len);

inline std::string HexStr(const std::vector<uint8_t>& data) {
    return HexStr(data.data(), data.size());
}

/// Decode hex in either case; nullopt on odd length or a non-hex character
std::optional<std::vector<uint8_t>> ParseHex(std::string_view hex);

} // namespace foresight

#endif // FORESIGHT_CORE_HEX_H
