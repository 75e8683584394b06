// ZKDROP - Core Types Header
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// This file defines fundamental types used throughout ZKDROP.

#ifndef ZKDROP_CORE_TYPES_H
#define ZKDROP_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <stdexcept>
#include <cstring>

namespace zkdrop {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token quantity in the token's smallest unit
using Amount = uint64_t;

/// Airdrop identifier (0 is reserved as "no such airdrop")
using AirdropId = uint64_t;

/// Identifier of an externally managed membership group
using GroupId = uint64_t;

/// First identifier handed out by a fresh registry
constexpr AirdropId FIRST_AIRDROP_ID = 1;

// ============================================================================
// Fixed-size byte strings
// ============================================================================

/// Fixed-size byte string. Hex form is in storage order (byte 0 first).
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - all zeros
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes; short input is zero padded
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }
    
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    void SetNull() noexcept {
        data_.fill(0);
    }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }
    
    /// Lowercase hex without prefix
    std::string ToHex() const;
    
    /// Parse hex, with or without a leading "0x". Throws std::invalid_argument.
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& other) : BaseHash<256>(other) {}
    
    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/**
 * 20-byte account address.
 * 
 * Used for every principal (caller, manager, holder, receiver), for token
 * references and for the identity of the airdrop deployment itself.
 */
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    Address(const BaseHash<160>& other) : BaseHash<160>(other) {}
    
    static Address FromHex(const std::string& hex) {
        return Address(BaseHash<160>::FromHex(hex));
    }
    
    /// "0x"-prefixed form used in logs and RPC output
    std::string ToString() const { return "0x" + ToHex(); }
};

} // namespace zkdrop

#endif // ZKDROP_CORE_TYPES_H
