// FORESIGHT - Core Types
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/core/types.h"
#include "foresight/core/hex.h"

#include <stdexcept>

namespace foresight {

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return HexStr(data_.data(), SIZE);
}

template<size_t BITS>
std::optional<BaseHash<BITS>> BaseHash<BITS>::TryFromHex(std::string_view hex) {
    if (hex.size() != SIZE * 2) {
        return std::nullopt;
    }
    auto bytes = ParseHex(hex);
    if (!bytes) {
        return std::nullopt;
    }
    return BaseHash(bytes->data(), bytes->size());
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(std::string_view hex) {
    auto result = TryFromHex(hex);
    if (!result) {
        throw std::invalid_argument("expected " + std::to_string(SIZE * 2) +
                                    " hex digits, got '" + std::string(hex) + "'");
    }
    return *result;
}

template class BaseHash<256>;
template class BaseHash<160>;

} // namespace foresight
