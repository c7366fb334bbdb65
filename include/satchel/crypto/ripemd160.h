// Satchel - RIPEMD160 Hash Function
// Copyright (c) 2024 Satchel Developers
// MIT License

#ifndef SATCHEL_CRYPTO_RIPEMD160_H
#define SATCHEL_CRYPTO_RIPEMD160_H

#include <cstdint>
#include <cstddef>
#include <vector>
#include "satchel/core/types.h"

namespace satchel {

/// Compute RIPEMD160 hash of data in a single call
Hash160 RIPEMD160Hash(const Byte* data, size_t len);

inline Hash160 RIPEMD160Hash(const std::vector<Byte>& data) {
    return RIPEMD160Hash(data.data(), data.size());
}

/// Compute Hash160 (RIPEMD160(SHA256(data))), the address hash of
/// public keys and redeem scripts
Hash160 ComputeHash160(const Byte* data, size_t len);

inline Hash160 ComputeHash160(const std::vector<Byte>& data) {
    return ComputeHash160(data.data(), data.size());
}

} // namespace satchel

#endif // SATCHEL_CRYPTO_RIPEMD160_H
