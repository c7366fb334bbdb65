// Satchel - Core Types Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/core/types.h"
#include "satchel/core/hex.h"

namespace satchel {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::GetHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    auto reversed = ReverseBytes(data_);
    return BytesToHex(reversed.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    // HexToBytes throws on a bad character
    auto bytes = HexToBytes(hex);
    std::reverse(bytes.begin(), bytes.end());
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<160>;
template class BaseHash<256>;
template class BaseHash<512>;

} // namespace satchel
