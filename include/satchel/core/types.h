// Satchel - Core Types Header
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Fundamental byte, amount and fixed-size hash types shared by every module.

#ifndef SATCHEL_CORE_TYPES_H
#define SATCHEL_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace satchel {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in satoshis (or the chain's smallest unit)
using Amount = uint64_t;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size hash value stored in internal (little-endian) byte order
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        return std::all_of(data_.begin(), data_.end(),
                           [](Byte b) { return b == 0; });
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Copy out as a byte vector in internal order
    std::vector<Byte> ToVector() const {
        return std::vector<Byte>(data_.begin(), data_.end());
    }

    /// Hex in internal byte order (no reversal)
    std::string GetHex() const;

    /// Hex in display order (byte-reversed, as block explorers show txids)
    std::string ToHex() const;

    /// Parse display-order hex; throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 512-bit hash (64 bytes)
class Hash512 : public BaseHash<512> {
public:
    using BaseHash<512>::BaseHash;
};

/// 160-bit hash (20 bytes) - for addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}
};

/// Transaction id. Stored in internal order; ToHex() gives the display form.
class TxHash : public Hash256 {
public:
    using Hash256::Hash256;
    TxHash() = default;
    explicit TxHash(const Hash256& h) : Hash256(h) {}

    static TxHash FromHex(const std::string& hex) {
        return TxHash(Hash256::FromHex(hex));
    }
};

// ============================================================================
// CompactSize Encoding
// ============================================================================

/// Get size of compact size encoding for a value
inline size_t GetCompactSizeSize(uint64_t value) {
    if (value < 253) return 1;
    if (value <= 0xFFFF) return 3;
    if (value <= 0xFFFFFFFF) return 5;
    return 9;
}

} // namespace satchel

#endif // SATCHEL_CORE_TYPES_H
