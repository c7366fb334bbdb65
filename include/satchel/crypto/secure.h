// Satchel - Secure Memory Helpers
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Scoped containers for key material. Every buffer here is overwritten with
// OPENSSL_cleanse when it goes out of scope, including on exception unwind.
// This covers the bytes the container owns; copies the caller makes
// elsewhere, swapped-out pages and register spills are outside its reach.

#ifndef SATCHEL_CRYPTO_SECURE_H
#define SATCHEL_CRYPTO_SECURE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace satchel {

/// Overwrite len bytes at ptr with zeros in a way the optimizer keeps
void SecureClear(void* ptr, size_t len);

/**
 * Fixed-size byte buffer that is zeroed on destruction.
 *
 * Used for 32-byte private keys, chain codes and 64-byte HMAC outputs on the
 * derivation path.
 */
template<size_t N>
class SecureBuffer {
public:
    static constexpr size_t SIZE = N;

    SecureBuffer() { data_.fill(0); }

    SecureBuffer(const uint8_t* data, size_t len) {
        data_.fill(0);
        for (size_t i = 0; i < len && i < N; ++i) {
            data_[i] = data[i];
        }
    }

    ~SecureBuffer() { Clear(); }

    SecureBuffer(const SecureBuffer& other) : data_(other.data_) {}

    SecureBuffer& operator=(const SecureBuffer& other) {
        if (this != &other) {
            data_ = other.data_;
        }
        return *this;
    }

    void Clear() { SecureClear(data_.data(), N); }

    uint8_t* data() { return data_.data(); }
    const uint8_t* data() const { return data_.data(); }
    constexpr size_t size() const { return N; }

    uint8_t& operator[](size_t i) { return data_[i]; }
    const uint8_t& operator[](size_t i) const { return data_[i]; }

    const uint8_t* begin() const { return data_.data(); }
    const uint8_t* end() const { return data_.data() + N; }

private:
    std::array<uint8_t, N> data_;
};

/**
 * Variable-length byte buffer that is zeroed on destruction, resize and
 * move-from. Used for seeds and HMAC input scratch.
 */
class SecureBytes {
public:
    SecureBytes() = default;
    explicit SecureBytes(size_t len) : data_(len, 0) {}
    SecureBytes(const uint8_t* data, size_t len) : data_(data, data + len) {}

    ~SecureBytes() { Clear(); }

    SecureBytes(const SecureBytes& other) : data_(other.data_) {}
    SecureBytes& operator=(const SecureBytes& other);

    SecureBytes(SecureBytes&& other) noexcept : data_(std::move(other.data_)) {
        other.data_.clear();
    }
    SecureBytes& operator=(SecureBytes&& other) noexcept;

    /// Zero and release the contents
    void Clear();

    /// Append bytes. Growth goes through reserve() so the old allocation is wiped.
    void Append(const uint8_t* data, size_t len);
    void Append(uint8_t byte) { Append(&byte, 1); }

    /// Grow capacity, wiping the previous allocation
    void reserve(size_t n);

    uint8_t* data() { return data_.data(); }
    const uint8_t* data() const { return data_.data(); }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    uint8_t& operator[](size_t i) { return data_[i]; }
    const uint8_t& operator[](size_t i) const { return data_[i]; }

private:
    std::vector<uint8_t> data_;
};

} // namespace satchel

#endif // SATCHEL_CRYPTO_SECURE_H
