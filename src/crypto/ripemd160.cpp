// Satchel - RIPEMD160 Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/crypto/ripemd160.h"
#include "satchel/crypto/sha256.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace satchel {

Hash160 RIPEMD160Hash(const Byte* data, size_t len) {
    Hash160 result;
    unsigned int outLen = 0;
    if (EVP_Digest(data, len, result.data(), &outLen, EVP_ripemd160(), nullptr) != 1 ||
        outLen != Hash160::SIZE) {
        throw std::runtime_error("RIPEMD160: digest failed");
    }
    return result;
}

Hash160 ComputeHash160(const Byte* data, size_t len) {
    Hash256 sha = SHA256Hash(data, len);
    return RIPEMD160Hash(sha.data(), sha.size());
}

} // namespace satchel
