// Satchel - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 Satchel Developers
// MIT License

#ifndef SATCHEL_CORE_HEX_H
#define SATCHEL_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace satchel {

/// Convert bytes to lowercase hex
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. Throws std::invalid_argument on odd length
/// or a non-hex character.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Non-throwing variant for validation call sites
std::optional<std::vector<uint8_t>> TryHexToBytes(const std::string& hex);

/// Check if string is valid, even-length hex
bool IsValidHex(const std::string& str);

/// Reverse bytes (for display purposes)
std::vector<uint8_t> ReverseBytes(const uint8_t* data, size_t len);

template<size_t N>
std::array<uint8_t, N> ReverseBytes(const std::array<uint8_t, N>& data) {
    std::array<uint8_t, N> result;
    for (size_t i = 0; i < N; ++i) {
        result[i] = data[N - 1 - i];
    }
    return result;
}

} // namespace satchel

#endif // SATCHEL_CORE_HEX_H
