// Satchel - Key Types Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <satchel/crypto/keys.h>
#include <satchel/crypto/hmac.h>
#include <satchel/crypto/ripemd160.h>
#include <satchel/core/hex.h>

#include <cstring>
#include <stdexcept>

namespace satchel {

// ============================================================================
// PublicKey Implementation
// ============================================================================

PublicKey::PublicKey(const uint8_t* data, size_t len) {
    data_.fill(0);
    if (data && len == COMPRESSED_SIZE && (data[0] == 0x02 || data[0] == 0x03)) {
        std::memcpy(data_.data(), data, COMPRESSED_SIZE);
        valid_ = secp256k1::IsValidPublicKey(data_.data(), COMPRESSED_SIZE);
    }
}

bool PublicKey::IsValid() const {
    return valid_;
}

Hash160 PublicKey::GetHash160() const {
    if (!valid_) {
        throw std::logic_error("PublicKey::GetHash160 on invalid key");
    }
    return ComputeHash160(data_.data(), COMPRESSED_SIZE);
}

bool PublicKey::Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const {
    if (!valid_) {
        return false;
    }
    return secp256k1::VerifyDER(hash.data(), data_.data(), COMPRESSED_SIZE, signature);
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), size());
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    auto bytes = TryHexToBytes(hex);
    if (!bytes) {
        return std::nullopt;
    }
    PublicKey key(bytes->data(), bytes->size());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::PrivateKey(const uint8_t* data) : data_(data, SIZE) {
    valid_ = secp256k1::IsValidPrivateKey(data_.data());
    if (!valid_) {
        data_.Clear();
    }
}

PrivateKey::PrivateKey(PrivateKey&& other) noexcept
    : data_(other.data_), valid_(other.valid_) {
    other.Clear();
}

PrivateKey& PrivateKey::operator=(PrivateKey&& other) noexcept {
    if (this != &other) {
        data_ = other.data_;
        valid_ = other.valid_;
        other.Clear();
    }
    return *this;
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }
    uint8_t pub[PublicKey::COMPRESSED_SIZE];
    if (!secp256k1::ComputePublicKey(data_.data(), pub)) {
        return PublicKey();
    }
    return PublicKey(pub, sizeof(pub));
}

std::vector<uint8_t> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) {
        throw std::logic_error("PrivateKey::Sign on invalid key");
    }
    auto sig = secp256k1::SignDER(hash.data(), data_.data());
    if (!sig) {
        throw std::runtime_error("PrivateKey::Sign: signing failed");
    }
    return *sig;
}

std::optional<PrivateKey> PrivateKey::TweakAdd(const uint8_t* tweak) const {
    if (!valid_) {
        return std::nullopt;
    }
    SecureBuffer<SIZE> result;
    if (!secp256k1::PrivateKeyTweakAdd(data_.data(), tweak, result.data())) {
        return std::nullopt;
    }
    return PrivateKey(result.data());
}

bool PrivateKey::operator==(const PrivateKey& other) const {
    return valid_ == other.valid_ &&
           ConstantTimeCompare(data_.data(), other.data_.data(), SIZE);
}

void PrivateKey::Clear() {
    data_.Clear();
    valid_ = false;
}

// ============================================================================
// KeyPair Implementation
// ============================================================================

KeyPair::KeyPair(PrivateKey priv)
    : privateKey_(std::move(priv)) {
    publicKey_ = privateKey_.GetPublicKey();
}

} // namespace satchel
