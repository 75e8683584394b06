// ZKDROP - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#ifndef ZKDROP_CORE_HEX_H
#define ZKDROP_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace zkdrop {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. Throws std::invalid_argument.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex (even length, non-empty)
bool IsValidHex(const std::string& str);

/// Drop a leading "0x" or "0X"
std::string StripHexPrefix(const std::string& hex);

} // namespace zkdrop

#endif // ZKDROP_CORE_HEX_H
