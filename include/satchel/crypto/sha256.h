// Satchel - SHA256 Hash Function
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Incremental SHA-256 backed by the OpenSSL EVP digest interface.

#ifndef SATCHEL_CRYPTO_SHA256_H
#define SATCHEL_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>
#include "satchel/core/types.h"

namespace satchel {

/// SHA-256 hasher with Write/Finalize/Reset streaming interface
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::vector<Byte>& data) {
        return Write(data.data(), data.size());
    }

    /// Finalize the hash into hash[0..31]. The hasher must be Reset() before reuse.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Finalize and return as Hash256
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute double SHA256 (SHA256(SHA256(data)))
Hash256 DoubleSHA256(const Byte* data, size_t len);

inline Hash256 DoubleSHA256(const std::vector<Byte>& data) {
    return DoubleSHA256(data.data(), data.size());
}

} // namespace satchel

#endif // SATCHEL_CRYPTO_SHA256_H
