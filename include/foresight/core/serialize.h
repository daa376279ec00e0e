// FORESIGHT - Serialization Header
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Byte-level serialization for persisted market records and journal entries.
// Integers are little-endian; lengths use CompactSize encoding.

#ifndef FORESIGHT_CORE_SERIALIZE_H
#define FORESIGHT_CORE_SERIALIZE_H

#include "foresight/core/types.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <ios>
#include <type_traits>

namespace foresight {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for serialized objects to prevent memory exhaustion
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Little-Endian Encoding
// ============================================================================

namespace detail {

template<typename T>
inline T ByteSwapIfBigEndian(T value) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    T swapped = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        swapped = static_cast<T>((swapped << 8) | ((value >> (8 * i)) & 0xFF));
    }
    return swapped;
#else
    return value;
#endif
}

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using value_type = uint8_t;
    using size_type = std::size_t;

    DataStream() = default;
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}
    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)) {}
    DataStream(const uint8_t* data, size_type len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_type size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }

    void clear() {
        data_.clear();
        readPos_ = 0;
    }

    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + readPos_; }

    /// Unread data as a byte string (store value encoding)
    std::string AsString() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    /// Lowercase hex of the unread bytes
    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_type readPos_ = 0;
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

/// Write an unsigned integer as sizeof(T) little-endian bytes
template<typename T, typename Stream>
inline void WriteLE(Stream& s, T value) {
    static_assert(std::is_unsigned<T>::value, "WriteLE takes unsigned types");
    value = detail::ByteSwapIfBigEndian(value);
    s.Write(reinterpret_cast<const uint8_t*>(&value), sizeof(T));
}

/// Read sizeof(T) little-endian bytes, throws std::ios_base::failure when short
template<typename T, typename Stream>
inline T ReadLE(Stream& s) {
    static_assert(std::is_unsigned<T>::value, "ReadLE takes unsigned types");
    T value;
    s.Read(reinterpret_cast<uint8_t*>(&value), sizeof(T));
    return detail::ByteSwapIfBigEndian(value);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 3 bytes (0xFD + 2 bytes little-endian)
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
//   size >  0xFFFFFFFF -- 9 bytes (0xFF + 8 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        WriteLE<uint8_t>(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE<uint8_t>(s, 0xFD);
        WriteLE<uint16_t>(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        WriteLE<uint8_t>(s, 0xFE);
        WriteLE<uint32_t>(s, static_cast<uint32_t>(size));
    } else {
        WriteLE<uint8_t>(s, 0xFF);
        WriteLE<uint64_t>(s, size);
    }
}

/// Decode a CompactSize, rejecting non-minimal encodings and sizes over MAX_SIZE
template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    const uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t size = marker;
    uint64_t minimum = 0;

    switch (marker) {
        case 0xFD: size = ReadLE<uint16_t>(s); minimum = 0xFD; break;
        case 0xFE: size = ReadLE<uint32_t>(s); minimum = 0x10000; break;
        case 0xFF: size = ReadLE<uint64_t>(s); minimum = 0x100000000ULL; break;
        default: break;
    }

    if (size < minimum) {
        throw std::ios_base::failure("non-canonical CompactSize");
    }
    if (size > MAX_SIZE) {
        throw std::ios_base::failure("CompactSize exceeds MAX_SIZE");
    }
    return size;
}

// ============================================================================
// Integers and Booleans
// ============================================================================

template<typename Stream> inline void Serialize(Stream& s, uint8_t a) { WriteLE<uint8_t>(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint32_t a) { WriteLE<uint32_t>(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint64_t a) { WriteLE<uint64_t>(s, a); }
template<typename Stream> inline void Serialize(Stream& s, int64_t a) {
    WriteLE<uint64_t>(s, static_cast<uint64_t>(a));
}
template<typename Stream> inline void Serialize(Stream& s, bool a) {
    WriteLE<uint8_t>(s, a ? 1 : 0);
}

template<typename Stream> inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<uint8_t>(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint32_t& a) { a = ReadLE<uint32_t>(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<uint64_t>(s); }
template<typename Stream> inline void Unserialize(Stream& s, int64_t& a) {
    a = static_cast<int64_t>(ReadLE<uint64_t>(s));
}

/// Only 0 and 1 are valid encodings
template<typename Stream> inline void Unserialize(Stream& s, bool& a) {
    const uint8_t raw = ReadLE<uint8_t>(s);
    if (raw > 1) {
        throw std::ios_base::failure("invalid boolean encoding");
    }
    a = (raw == 1);
}

// ============================================================================
// Length-Prefixed Byte Sequences
// ============================================================================

namespace detail {

template<typename Stream, typename Container>
void WriteSized(Stream& s, const Container& c) {
    WriteCompactSize(s, c.size());
    if (!c.empty()) {
        s.Write(reinterpret_cast<const uint8_t*>(c.data()), c.size());
    }
}

template<typename Stream, typename Container>
void ReadSized(Stream& s, Container& c) {
    const uint64_t size = ReadCompactSize(s);
    if (size > s.size()) {
        throw std::ios_base::failure("length prefix exceeds remaining data");
    }
    c.resize(static_cast<size_t>(size));
    if (size > 0) {
        s.Read(reinterpret_cast<uint8_t*>(&c[0]), c.size());
    }
}

} // namespace detail

template<typename Stream>
void Serialize(Stream& s, const std::string& str) { detail::WriteSized(s, str); }

template<typename Stream>
void Unserialize(Stream& s, std::string& str) { detail::ReadSized(s, str); }

template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) { detail::WriteSized(s, v); }

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) { detail::ReadSized(s, v); }

// ============================================================================
// Fixed-Width Hashes (raw bytes, no length prefix)
// ============================================================================

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

// ============================================================================
// GetSerializeSize - Calculate serialized size without serializing
// ============================================================================

class SizeComputer {
public:
    void Write(const uint8_t*, size_t len) { size_ += len; }
    void Write(const char*, size_t len) { size_ += len; }
    size_t size() const noexcept { return size_; }

private:
    size_t size_ = 0;
};

template<typename T>
size_t GetSerializeSize(const T& obj) {
    SizeComputer sc;
    Serialize(sc, obj);
    return sc.size();
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace foresight

#endif // FORESIGHT_CORE_SERIALIZE_H
