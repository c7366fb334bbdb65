// Satchel - Wallet Error Types
// Copyright (c) 2024 Satchel Developers
// MIT License
//
// Exceptions thrown by the signing core. Every error is deterministic for
// identical inputs; nothing here is transient or worth retrying.

#ifndef SATCHEL_WALLET_ERRORS_H
#define SATCHEL_WALLET_ERRORS_H

#include "satchel/core/types.h"

#include <stdexcept>
#include <string>

namespace satchel {
namespace wallet {

/// Error codes carried by wallet exceptions
enum class ErrorCode {
    // Caller input errors
    InvalidMnemonic,
    InvalidPath,
    InvalidAddress,
    EmptyIO,
    InvalidTxid,
    InvalidAmount,
    UnsupportedAddressType,
    UnknownChain,
    Locked,
    InvalidConfig,

    // Cryptographic invariant violations
    InvalidMasterKey,
    InvalidChild,
    SigningFailed,

    // Funding errors
    InsufficientFunds,
    FeeRatioExceeded,
    BelowDust,
};

/// Convert error code to string
const char* ErrorCodeToString(ErrorCode code);

/// Base class of every exception thrown by the wallet layer
class WalletError : public std::runtime_error {
public:
    WalletError(ErrorCode code, const std::string& what)
        : std::runtime_error(std::string(ErrorCodeToString(code)) + ": " + what)
        , code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Malformed mnemonic, path, address, or an empty input/output list
class ValidationError : public WalletError {
public:
    using WalletError::WalletError;
};

/// Derived key is zero or not below the curve order, or signing failed
class CryptographicInvariantError : public WalletError {
public:
    using WalletError::WalletError;
};

/**
 * Selection cannot cover target + fee, or a sweep fails its fee-ratio or
 * dust guard. Carries the numbers that were compared.
 */
class InsufficientFundsError : public WalletError {
public:
    InsufficientFundsError(ErrorCode code, const std::string& what,
                           Amount required, Amount available)
        : WalletError(code, what), required_(required), available_(available) {}

    Amount required() const noexcept { return required_; }
    Amount available() const noexcept { return available_; }

private:
    Amount required_;
    Amount available_;
};

} // namespace wallet
} // namespace satchel

#endif // SATCHEL_WALLET_ERRORS_H
