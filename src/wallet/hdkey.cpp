// Satchel - HD Key Derivation Implementation (BIP32/BIP39/BIP44)
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <satchel/wallet/hdkey.h>
#include <satchel/wallet/address.h>
#include <satchel/wallet/errors.h>
#include <satchel/crypto/hmac.h>
#include <satchel/crypto/ripemd160.h>
#include <satchel/crypto/secp256k1.h>
#include <satchel/util/logging.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace satchel {
namespace wallet {

namespace {

const char BIP32_SEED_KEY[] = "Bitcoin seed";

void WriteBE32(uint8_t* out, uint32_t v) {
    out[0] = static_cast<uint8_t>(v >> 24);
    out[1] = static_cast<uint8_t>(v >> 16);
    out[2] = static_cast<uint8_t>(v >> 8);
    out[3] = static_cast<uint8_t>(v);
}

} // namespace

// ============================================================================
// Derivation Policy
// ============================================================================

const char* DerivationPolicyToString(DerivationPolicy policy) {
    switch (policy) {
        case DerivationPolicy::Strict:         return "strict";
        case DerivationPolicy::RetryNextIndex: return "retry-next-index";
    }
    return "unknown";
}

std::optional<DerivationPolicy> DerivationPolicyFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "strict") return DerivationPolicy::Strict;
    if (lower == "retry-next-index" || lower == "retry") return DerivationPolicy::RetryNextIndex;
    return std::nullopt;
}

uint32_t DeriveWithPolicy(uint32_t index, DerivationPolicy policy,
                          const std::function<bool(uint32_t)>& attempt) {
    if (attempt(index)) {
        return index;
    }

    const bool hardened = (index & HARDENED_FLAG) != 0;
    if (policy == DerivationPolicy::Strict || hardened) {
        throw CryptographicInvariantError(ErrorCode::InvalidChild,
            "invalid child key at index " + std::to_string(index));
    }

    uint32_t next = index;
    for (uint32_t retry = 0; retry < MAX_DERIVATION_RETRIES; ++retry) {
        ++next;
        if (next & HARDENED_FLAG) {
            break;
        }
        LOG_WARN(util::LogCategory::KEYS) << "Invalid child at index " << (next - 1)
                                          << ", retrying with " << next;
        if (attempt(next)) {
            return next;
        }
    }
    throw CryptographicInvariantError(ErrorCode::InvalidChild,
        "no valid child key within " + std::to_string(MAX_DERIVATION_RETRIES) +
        " indices of " + std::to_string(index));
}

// ============================================================================
// PathComponent / DerivationPath
// ============================================================================

std::string PathComponent::ToString() const {
    return std::to_string(index) + (hardened ? "'" : "");
}

std::optional<DerivationPath> DerivationPath::Parse(const std::string& path) {
    if (path.empty() || path[0] != 'm') {
        return std::nullopt;
    }
    if (path.size() == 1) {
        return DerivationPath();
    }
    if (path[1] != '/') {
        return std::nullopt;
    }

    std::vector<PathComponent> components;
    size_t pos = 2;
    while (true) {
        size_t end = path.find('/', pos);
        std::string part = path.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        if (part.empty()) {
            return std::nullopt;
        }

        bool hardened = false;
        char last = part.back();
        if (last == '\'' || last == 'h' || last == 'H') {
            hardened = true;
            part.pop_back();
        }
        if (part.empty() || part.size() > 10) {
            return std::nullopt;
        }
        if (!std::all_of(part.begin(), part.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            return std::nullopt;
        }
        uint64_t value = std::stoull(part);
        if (value >= HARDENED_FLAG) {
            return std::nullopt;
        }

        components.emplace_back(static_cast<uint32_t>(value), hardened);
        if (components.size() > MAX_PATH_DEPTH) {
            return std::nullopt;
        }
        if (end == std::string::npos) {
            break;
        }
        pos = end + 1;
    }
    return DerivationPath(std::move(components));
}

DerivationPath DerivationPath::FromString(const std::string& path) {
    auto parsed = Parse(path);
    if (!parsed) {
        throw ValidationError(ErrorCode::InvalidPath, "malformed derivation path '" + path + "'");
    }
    return *parsed;
}

DerivationPath DerivationPath::ForAccount(AddressType type, uint32_t coinType,
                                          uint32_t accountIndex, uint32_t change) {
    if (coinType >= HARDENED_FLAG || accountIndex >= HARDENED_FLAG || change >= HARDENED_FLAG) {
        throw ValidationError(ErrorCode::InvalidPath, "path index out of range");
    }
    return DerivationPath({
        PathComponent(PurposeForAddressType(type), true),
        PathComponent(coinType, true),
        PathComponent(0, true),
        PathComponent(change, false),
        PathComponent(accountIndex, false),
    });
}

DerivationPath DerivationPath::Child(uint32_t index, bool hardened) const {
    if (index >= HARDENED_FLAG) {
        throw ValidationError(ErrorCode::InvalidPath, "path index out of range");
    }
    if (components_.size() >= MAX_PATH_DEPTH) {
        throw ValidationError(ErrorCode::InvalidPath, "path too deep");
    }
    auto components = components_;
    components.emplace_back(index, hardened);
    return DerivationPath(std::move(components));
}

std::string DerivationPath::ToString() const {
    std::ostringstream ss;
    ss << "m";
    for (const auto& c : components_) {
        ss << "/" << c.ToString();
    }
    return ss.str();
}

// ============================================================================
// ExtendedKey
// ============================================================================

ExtendedKey ExtendedKey::FromSeed(const Byte* seed, size_t seedLen) {
    if (seedLen < 16 || seedLen > 64) {
        throw CryptographicInvariantError(ErrorCode::InvalidMasterKey,
            "seed must be between 16 and 64 bytes");
    }

    auto I = ComputeHMAC_SHA512(reinterpret_cast<const Byte*>(BIP32_SEED_KEY),
                                sizeof(BIP32_SEED_KEY) - 1, seed, seedLen);

    if (!secp256k1::IsValidPrivateKey(I.data())) {
        throw CryptographicInvariantError(ErrorCode::InvalidMasterKey,
            "master key is zero or not below the curve order");
    }

    ExtendedKey key;
    key.privateKey_ = PrivateKey(I.data());
    key.publicKey_ = key.privateKey_.GetPublicKey();
    key.chainCode_ = SecureBuffer<CHAIN_CODE_SIZE>(I.data() + 32, CHAIN_CODE_SIZE);
    key.valid_ = true;
    return key;
}

bool ExtendedKey::TryDeriveChild(uint32_t index, ExtendedKey& out) const {
    // data = 0x00 || k || index (hardened) or serP(K) || index
    SecureBytes data;
    data.reserve(37);
    if (index & HARDENED_FLAG) {
        data.Append(0x00);
        data.Append(privateKey_.data(), PrivateKey::SIZE);
    } else {
        data.Append(publicKey_.data(), publicKey_.size());
    }
    uint8_t indexBytes[4];
    WriteBE32(indexBytes, index);
    data.Append(indexBytes, 4);

    auto I = ComputeHMAC_SHA512(chainCode_.data(), CHAIN_CODE_SIZE, data.data(), data.size());

    // Rejects IL >= n and a zero sum
    auto child = privateKey_.TweakAdd(I.data());
    if (!child) {
        return false;
    }

    out.privateKey_ = std::move(*child);
    out.publicKey_ = out.privateKey_.GetPublicKey();
    out.chainCode_ = SecureBuffer<CHAIN_CODE_SIZE>(I.data() + 32, CHAIN_CODE_SIZE);
    out.depth_ = static_cast<uint8_t>(depth_ + 1);
    out.parentFingerprint_ = GetFingerprint();
    out.childNumber_ = index;
    out.valid_ = true;
    return true;
}

ExtendedKey ExtendedKey::DeriveChild(uint32_t index, DerivationPolicy policy) const {
    if (!valid_) {
        throw std::logic_error("cannot derive from an invalid extended key");
    }
    if (!IsPrivate()) {
        throw std::logic_error("public child derivation is not supported");
    }
    if (depth_ == 255) {
        throw ValidationError(ErrorCode::InvalidPath, "maximum key depth reached");
    }

    ExtendedKey child;
    DeriveWithPolicy(index, policy, [&](uint32_t i) { return TryDeriveChild(i, child); });
    return child;
}

ExtendedKey ExtendedKey::DerivePath(const DerivationPath& path, DerivationPolicy policy) const {
    LOG_DEBUG(util::LogCategory::KEYS) << "Deriving " << path.ToString();

    ExtendedKey current = *this;
    for (const auto& component : path.GetComponents()) {
        current = current.DeriveChild(component.GetFullIndex(), policy);
    }
    return current;
}

const PrivateKey& ExtendedKey::GetPrivateKey() const {
    if (!IsPrivate()) {
        throw std::logic_error("extended key has no private part");
    }
    return privateKey_;
}

uint32_t ExtendedKey::GetFingerprint() const {
    Hash160 id = publicKey_.GetHash160();
    return (static_cast<uint32_t>(id[0]) << 24) |
           (static_cast<uint32_t>(id[1]) << 16) |
           (static_cast<uint32_t>(id[2]) << 8) |
           static_cast<uint32_t>(id[3]);
}

ExtendedKey ExtendedKey::Neuter() const {
    ExtendedKey pub;
    pub.publicKey_ = publicKey_;
    pub.chainCode_ = chainCode_;
    pub.depth_ = depth_;
    pub.parentFingerprint_ = parentFingerprint_;
    pub.childNumber_ = childNumber_;
    pub.valid_ = valid_;
    return pub;
}

std::string ExtendedKey::ToBase58() const {
    if (!valid_) {
        return "";
    }

    SecureBytes data;
    data.reserve(SERIALIZED_SIZE);

    uint8_t be[4];
    WriteBE32(be, IsPrivate() ? XPRV_VERSION : XPUB_VERSION);
    data.Append(be, 4);
    data.Append(depth_);
    WriteBE32(be, parentFingerprint_);
    data.Append(be, 4);
    WriteBE32(be, childNumber_);
    data.Append(be, 4);
    data.Append(chainCode_.data(), CHAIN_CODE_SIZE);
    if (IsPrivate()) {
        data.Append(0x00);
        data.Append(privateKey_.data(), PrivateKey::SIZE);
    } else {
        data.Append(publicKey_.data(), publicKey_.size());
    }

    std::vector<uint8_t> payload(data.data(), data.data() + data.size());
    std::string encoded = EncodeBase58Check(payload);
    SecureClear(payload.data(), payload.size());
    return encoded;
}

void ExtendedKey::Clear() {
    privateKey_.Clear();
    chainCode_.Clear();
    valid_ = false;
}

// ============================================================================
// Mnemonic
// ============================================================================

SecureBytes Mnemonic::ToSeed(const std::string& mnemonic, const std::string& passphrase) {
    SATCHEL_LOG_TIMER(util::LogCategory::KEYS, "BIP39 seed stretch");
    return PBKDF2_SHA512(mnemonic, "mnemonic" + passphrase,
                         BIP39_PBKDF2_ROUNDS, BIP39_SEED_SIZE);
}

bool Mnemonic::IsWellFormed(const std::string& mnemonic) {
    if (mnemonic.empty() || mnemonic.front() == ' ' || mnemonic.back() == ' ') {
        return false;
    }

    size_t words = 1;
    char prev = 0;
    for (char c : mnemonic) {
        if (c == ' ') {
            if (prev == ' ') {
                return false;
            }
            ++words;
        } else if (c < 'a' || c > 'z') {
            return false;
        }
        prev = c;
    }
    return words >= 12 && words <= 24 && words % 3 == 0;
}

MnemonicValidator Mnemonic::DefaultValidator() {
    return [](const std::string& mnemonic) { return IsWellFormed(mnemonic); };
}

} // namespace wallet
} // namespace satchel
