// Satchel - Secure Memory Helpers Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/crypto/secure.h"

#include <algorithm>

#include <openssl/crypto.h>

namespace satchel {

void SecureClear(void* ptr, size_t len) {
    if (ptr && len > 0) {
        OPENSSL_cleanse(ptr, len);
    }
}

SecureBytes& SecureBytes::operator=(const SecureBytes& other) {
    if (this != &other) {
        Clear();
        data_ = other.data_;
    }
    return *this;
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        Clear();
        data_ = std::move(other.data_);
        other.data_.clear();
    }
    return *this;
}

void SecureBytes::Clear() {
    SecureClear(data_.data(), data_.size());
    data_.clear();
}

void SecureBytes::reserve(size_t n) {
    if (n <= data_.capacity()) {
        return;
    }
    // Move into a fresh allocation and wipe the old one
    std::vector<uint8_t> grown;
    grown.reserve(n);
    grown.assign(data_.begin(), data_.end());
    SecureClear(data_.data(), data_.size());
    data_.swap(grown);
}

void SecureBytes::Append(const uint8_t* data, size_t len) {
    if (data_.size() + len > data_.capacity()) {
        reserve(std::max(data_.size() + len, data_.capacity() * 2));
    }
    data_.insert(data_.end(), data, data + len);
}

} // namespace satchel
