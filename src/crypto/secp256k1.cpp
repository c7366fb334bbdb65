// Satchel - secp256k1 Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/crypto/secp256k1.h"
#include "satchel/crypto/hmac.h"
#include "satchel/crypto/secure.h"

#include <cstring>
#include <memory>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

namespace satchel {
namespace secp256k1 {

namespace {

// ============================================================================
// OpenSSL RAII Helpers
// ============================================================================

struct BNDeleter {
    void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct BNCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct PointDeleter {
    void operator()(EC_POINT* p) const { EC_POINT_clear_free(p); }
};
struct GroupDeleter {
    void operator()(EC_GROUP* g) const { EC_GROUP_free(g); }
};

using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;
using BNCtxPtr = std::unique_ptr<BN_CTX, BNCtxDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;

/// Shared, read-only curve group
const EC_GROUP* Group() {
    static GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!group) {
        throw std::runtime_error("secp256k1: curve unavailable");
    }
    return group.get();
}

BNPtr NewBN() {
    BNPtr bn(BN_secure_new());
    if (!bn) throw std::runtime_error("secp256k1: BN_secure_new failed");
    return bn;
}

BNPtr BNFromBytes(const uint8_t* data, size_t len) {
    BNPtr bn(BN_bin2bn(data, static_cast<int>(len), nullptr));
    if (!bn) throw std::runtime_error("secp256k1: BN_bin2bn failed");
    return bn;
}

BNCtxPtr NewCtx() {
    BNCtxPtr ctx(BN_CTX_secure_new());
    if (!ctx) throw std::runtime_error("secp256k1: BN_CTX_new failed");
    return ctx;
}

PointPtr NewPoint() {
    PointPtr p(EC_POINT_new(Group()));
    if (!p) throw std::runtime_error("secp256k1: EC_POINT_new failed");
    return p;
}

const BIGNUM* Order() {
    static BNPtr order(BN_bin2bn(CURVE_ORDER.data(), 32, nullptr));
    return order.get();
}

/// Write bn as a 32-byte big-endian value
void BNToBytes32(const BIGNUM* bn, uint8_t* out) {
    if (BN_bn2binpad(bn, out, 32) != 32) {
        throw std::runtime_error("secp256k1: scalar does not fit in 32 bytes");
    }
}

int Compare32(const uint8_t* a, const uint8_t* b) {
    return std::memcmp(a, b, 32);
}

bool IsZero32(const uint8_t* a) {
    uint8_t acc = 0;
    for (size_t i = 0; i < 32; ++i) acc |= a[i];
    return acc == 0;
}

/// Decode 33/65 byte public key into a point
PointPtr ParsePoint(const uint8_t* pubkey, size_t len, BN_CTX* ctx) {
    if (len != COMPRESSED_PUBKEY_SIZE && len != UNCOMPRESSED_PUBKEY_SIZE) {
        return nullptr;
    }
    PointPtr point = NewPoint();
    if (EC_POINT_oct2point(Group(), point.get(), pubkey, len, ctx) != 1) {
        return nullptr;
    }
    if (EC_POINT_is_on_curve(Group(), point.get(), ctx) != 1) {
        return nullptr;
    }
    return point;
}

// ============================================================================
// RFC 6979 Deterministic Nonce
// ============================================================================

/**
 * HMAC-DRBG instantiated per RFC 6979 section 3.2 with HMAC-SHA256,
 * qlen = hlen = 256 so bits2int is the identity on 32-byte strings.
 */
class NonceGenerator {
public:
    NonceGenerator(const uint8_t* privateKey, const uint8_t* hash) {
        // h1 = bits2octets(hash) = int(hash) mod n
        uint8_t h1[32];
        std::memcpy(h1, hash, 32);
        if (Compare32(h1, CURVE_ORDER.data()) >= 0) {
            auto ctx = NewCtx();
            auto z = BNFromBytes(hash, 32);
            auto reduced = NewBN();
            BN_mod(reduced.get(), z.get(), Order(), ctx.get());
            BNToBytes32(reduced.get(), h1);
        }

        std::memset(v_.data(), 0x01, 32);
        std::memset(k_.data(), 0x00, 32);

        SecureBytes seed;
        seed.reserve(32 + 1 + 32 + 32);
        seed.Append(v_.data(), 32);
        seed.Append(static_cast<uint8_t>(0x00));
        seed.Append(privateKey, 32);
        seed.Append(h1, 32);

        k_ = Mac(k_, seed.data(), seed.size());
        v_ = Mac(k_, v_.data(), 32);

        seed[32] = 0x01;
        std::memcpy(seed.data(), v_.data(), 32);
        k_ = Mac(k_, seed.data(), seed.size());
        v_ = Mac(k_, v_.data(), 32);

        SecureClear(h1, sizeof(h1));
    }

    /// Produce the next candidate k in [1, n)
    void Next(uint8_t* out) {
        for (;;) {
            if (retry_) {
                uint8_t buf[33];
                std::memcpy(buf, v_.data(), 32);
                buf[32] = 0x00;
                k_ = Mac(k_, buf, sizeof(buf));
                v_ = Mac(k_, v_.data(), 32);
            }
            retry_ = true;

            v_ = Mac(k_, v_.data(), 32);
            if (!IsZero32(v_.data()) && Compare32(v_.data(), CURVE_ORDER.data()) < 0) {
                std::memcpy(out, v_.data(), 32);
                return;
            }
        }
    }

private:
    static SecureBuffer<32> Mac(const SecureBuffer<32>& key, const uint8_t* data, size_t len) {
        Hash256 mac = ComputeHMAC_SHA256(key.data(), key.size(), data, len);
        SecureBuffer<32> out(mac.data(), mac.size());
        SecureClear(mac.data(), mac.size());
        return out;
    }

    SecureBuffer<32> k_;
    SecureBuffer<32> v_;
    bool retry_{false};
};

/// Raw ECDSA signing core: returns (r, s) with s normalized to low-S
bool SignRaw(const uint8_t* hash, const uint8_t* privateKey, uint8_t* r, uint8_t* s) {
    if (!IsValidPrivateKey(privateKey)) {
        return false;
    }

    auto ctx = NewCtx();
    auto d = BNFromBytes(privateKey, 32);
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);

    // z = int(hash) mod n
    auto zRaw = BNFromBytes(hash, 32);
    auto z = NewBN();
    BN_nnmod(z.get(), zRaw.get(), Order(), ctx.get());

    NonceGenerator nonces(privateKey, hash);
    SecureBuffer<32> kBytes;
    auto R = NewPoint();
    auto rx = NewBN();
    auto rBN = NewBN();
    auto sBN = NewBN();
    auto kInv = NewBN();
    auto tmp = NewBN();

    for (;;) {
        nonces.Next(kBytes.data());
        auto k = BNFromBytes(kBytes.data(), 32);
        BN_set_flags(k.get(), BN_FLG_CONSTTIME);

        // R = k*G, r = R.x mod n
        if (EC_POINT_mul(Group(), R.get(), k.get(), nullptr, nullptr, ctx.get()) != 1 ||
            EC_POINT_get_affine_coordinates(Group(), R.get(), rx.get(), nullptr, ctx.get()) != 1) {
            throw std::runtime_error("secp256k1: point multiplication failed");
        }
        BN_nnmod(rBN.get(), rx.get(), Order(), ctx.get());
        if (BN_is_zero(rBN.get())) {
            continue;
        }

        // s = k^-1 * (z + r*d) mod n
        if (!BN_mod_inverse(kInv.get(), k.get(), Order(), ctx.get()) ||
            BN_mod_mul(tmp.get(), rBN.get(), d.get(), Order(), ctx.get()) != 1 ||
            BN_mod_add(tmp.get(), tmp.get(), z.get(), Order(), ctx.get()) != 1 ||
            BN_mod_mul(sBN.get(), kInv.get(), tmp.get(), Order(), ctx.get()) != 1) {
            throw std::runtime_error("secp256k1: scalar arithmetic failed");
        }
        if (BN_is_zero(sBN.get())) {
            continue;
        }
        break;
    }

    BNToBytes32(rBN.get(), r);
    BNToBytes32(sBN.get(), s);

    // Low-S normalization: s > n/2 becomes n - s
    if (!IsLowS(s)) {
        BN_sub(sBN.get(), Order(), sBN.get());
        BNToBytes32(sBN.get(), s);
    }
    return true;
}

/// Append a DER INTEGER for a 32-byte big-endian unsigned value
void AppendDERInteger(std::vector<uint8_t>& out, const uint8_t* value) {
    size_t start = 0;
    while (start < 31 && value[start] == 0) {
        ++start;
    }
    bool pad = (value[start] & 0x80) != 0;
    size_t len = 32 - start + (pad ? 1 : 0);

    out.push_back(0x02);
    out.push_back(static_cast<uint8_t>(len));
    if (pad) {
        out.push_back(0x00);
    }
    out.insert(out.end(), value + start, value + 32);
}

/// Parse one DER INTEGER at pos into a 32-byte buffer
bool ParseDERInteger(const std::vector<uint8_t>& der, size_t& pos, uint8_t* out) {
    if (pos + 2 > der.size() || der[pos] != 0x02) {
        return false;
    }
    size_t len = der[pos + 1];
    pos += 2;
    if (len == 0 || pos + len > der.size()) {
        return false;
    }
    const uint8_t* p = der.data() + pos;
    // Negative values are not allowed
    if (p[0] & 0x80) {
        return false;
    }
    // No unnecessary leading zero
    if (len > 1 && p[0] == 0x00 && !(p[1] & 0x80)) {
        return false;
    }
    if (p[0] == 0x00) {
        ++p;
        --len;
    }
    if (len > 32) {
        return false;
    }
    std::memset(out, 0, 32);
    std::memcpy(out + (32 - len), p, len);
    pos += (p - (der.data() + pos)) + len;
    return true;
}

} // namespace

// ============================================================================
// Key Operations
// ============================================================================

bool IsValidPrivateKey(const uint8_t* key) {
    return !IsZero32(key) && Compare32(key, CURVE_ORDER.data()) < 0;
}

bool IsValidPublicKey(const uint8_t* pubkey, size_t len) {
    auto ctx = NewCtx();
    return ParsePoint(pubkey, len, ctx.get()) != nullptr;
}

bool ComputePublicKey(const uint8_t* privateKey, uint8_t* out) {
    if (!IsValidPrivateKey(privateKey)) {
        return false;
    }

    auto ctx = NewCtx();
    auto d = BNFromBytes(privateKey, 32);
    BN_set_flags(d.get(), BN_FLG_CONSTTIME);
    auto point = NewPoint();

    if (EC_POINT_mul(Group(), point.get(), d.get(), nullptr, nullptr, ctx.get()) != 1) {
        throw std::runtime_error("secp256k1: point multiplication failed");
    }
    size_t written = EC_POINT_point2oct(Group(), point.get(), POINT_CONVERSION_COMPRESSED,
                                        out, COMPRESSED_PUBKEY_SIZE, ctx.get());
    if (written != COMPRESSED_PUBKEY_SIZE) {
        throw std::runtime_error("secp256k1: point encoding failed");
    }
    return true;
}

bool PrivateKeyTweakAdd(const uint8_t* key, const uint8_t* tweak, uint8_t* result) {
    if (Compare32(tweak, CURVE_ORDER.data()) >= 0) {
        return false;
    }

    auto ctx = NewCtx();
    auto a = BNFromBytes(key, 32);
    auto b = BNFromBytes(tweak, 32);
    auto sum = NewBN();
    if (BN_mod_add(sum.get(), a.get(), b.get(), Order(), ctx.get()) != 1) {
        throw std::runtime_error("secp256k1: BN_mod_add failed");
    }
    if (BN_is_zero(sum.get())) {
        return false;
    }
    BNToBytes32(sum.get(), result);
    return true;
}

// ============================================================================
// ECDSA
// ============================================================================

std::optional<std::array<uint8_t, 64>> SignCompact(const uint8_t* hash,
                                                   const uint8_t* privateKey) {
    std::array<uint8_t, 64> sig{};
    if (!SignRaw(hash, privateKey, sig.data(), sig.data() + 32)) {
        return std::nullopt;
    }
    return sig;
}

std::optional<std::vector<uint8_t>> SignDER(const uint8_t* hash, const uint8_t* privateKey) {
    auto compact = SignCompact(hash, privateKey);
    if (!compact) {
        return std::nullopt;
    }
    return EncodeDER(compact->data(), compact->data() + 32);
}

bool VerifyDER(const uint8_t* hash, const uint8_t* pubkey, size_t pubkeyLen,
               const std::vector<uint8_t>& signature) {
    uint8_t r[32], s[32];
    if (!DecodeDER(signature, r, s)) {
        return false;
    }
    if (!IsValidPrivateKey(r) || !IsValidPrivateKey(s)) {
        return false;  // r, s must both be in [1, n)
    }

    auto ctx = NewCtx();
    auto Q = ParsePoint(pubkey, pubkeyLen, ctx.get());
    if (!Q) {
        return false;
    }

    auto zRaw = BNFromBytes(hash, 32);
    auto z = NewBN();
    BN_nnmod(z.get(), zRaw.get(), Order(), ctx.get());
    auto rBN = BNFromBytes(r, 32);
    auto sBN = BNFromBytes(s, 32);
    auto w = NewBN();
    auto u1 = NewBN();
    auto u2 = NewBN();
    if (!BN_mod_inverse(w.get(), sBN.get(), Order(), ctx.get()) ||
        BN_mod_mul(u1.get(), z.get(), w.get(), Order(), ctx.get()) != 1 ||
        BN_mod_mul(u2.get(), rBN.get(), w.get(), Order(), ctx.get()) != 1) {
        return false;
    }

    // P = u1*G + u2*Q
    auto P = NewPoint();
    if (EC_POINT_mul(Group(), P.get(), u1.get(), Q.get(), u2.get(), ctx.get()) != 1 ||
        EC_POINT_is_at_infinity(Group(), P.get())) {
        return false;
    }
    auto px = NewBN();
    if (EC_POINT_get_affine_coordinates(Group(), P.get(), px.get(), nullptr, ctx.get()) != 1) {
        return false;
    }
    auto pxModN = NewBN();
    BN_nnmod(pxModN.get(), px.get(), Order(), ctx.get());
    return BN_cmp(pxModN.get(), rBN.get()) == 0;
}

// ============================================================================
// Signature Encoding
// ============================================================================

std::vector<uint8_t> EncodeDER(const uint8_t* r, const uint8_t* s) {
    std::vector<uint8_t> body;
    body.reserve(MAX_DER_SIGNATURE_SIZE);
    AppendDERInteger(body, r);
    AppendDERInteger(body, s);

    std::vector<uint8_t> der;
    der.reserve(body.size() + 2);
    der.push_back(0x30);
    der.push_back(static_cast<uint8_t>(body.size()));
    der.insert(der.end(), body.begin(), body.end());
    return der;
}

bool DecodeDER(const std::vector<uint8_t>& der, uint8_t* r, uint8_t* s) {
    if (der.size() < 8 || der.size() > MAX_DER_SIGNATURE_SIZE) {
        return false;
    }
    if (der[0] != 0x30 || der[1] != der.size() - 2) {
        return false;
    }
    size_t pos = 2;
    if (!ParseDERInteger(der, pos, r)) {
        return false;
    }
    if (!ParseDERInteger(der, pos, s)) {
        return false;
    }
    return pos == der.size();
}

bool IsLowS(const uint8_t* s) {
    return Compare32(s, HALF_CURVE_ORDER.data()) <= 0;
}

} // namespace secp256k1
} // namespace satchel
