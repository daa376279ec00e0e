// FORESIGHT - Serialization Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/core/serialize.h"
#include "foresight/core/hex.h"

namespace foresight {

std::string DataStream::ToHex() const {
    return HexStr(data(), size());
}

} // namespace foresight
