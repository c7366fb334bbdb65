// Satchel - Wallet Error Types Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/wallet/errors.h"

namespace satchel {
namespace wallet {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidMnemonic:        return "InvalidMnemonic";
        case ErrorCode::InvalidPath:            return "InvalidPath";
        case ErrorCode::InvalidAddress:         return "InvalidAddress";
        case ErrorCode::EmptyIO:                return "EmptyIO";
        case ErrorCode::InvalidTxid:            return "InvalidTxid";
        case ErrorCode::InvalidAmount:          return "InvalidAmount";
        case ErrorCode::UnsupportedAddressType: return "UnsupportedAddressType";
        case ErrorCode::UnknownChain:           return "UnknownChain";
        case ErrorCode::Locked:                 return "Locked";
        case ErrorCode::InvalidConfig:          return "InvalidConfig";
        case ErrorCode::InvalidMasterKey:       return "InvalidMasterKey";
        case ErrorCode::InvalidChild:           return "InvalidChild";
        case ErrorCode::SigningFailed:          return "SigningFailed";
        case ErrorCode::InsufficientFunds:      return "InsufficientFunds";
        case ErrorCode::FeeRatioExceeded:       return "FeeRatioExceeded";
        case ErrorCode::BelowDust:              return "BelowDust";
    }
    return "Unknown";
}

} // namespace wallet
} // namespace satchel
