// Satchel - Serialization Implementation
// Copyright (c) 2024 Satchel Developers
// MIT License

#include "satchel/core/serialize.h"
#include "satchel/core/hex.h"

namespace satchel {

std::string DataStream::ToHex() const {
    return BytesToHex(data_);
}

} // namespace satchel
