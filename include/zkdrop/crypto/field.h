// ZKDROP - Field Elements
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// 256-bit integers and canonical elements of the BN254 scalar field, the
// field in which group roots, nullifiers, signals and proof points live.

#ifndef ZKDROP_CRYPTO_FIELD_H
#define ZKDROP_CRYPTO_FIELD_H

#include <cstdint>
#include <array>
#include <optional>
#include <string>
#include "zkdrop/core/types.h"

namespace zkdrop {

// ============================================================================
// 256-bit Unsigned Integer
// ============================================================================

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;
    
    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;
    
    constexpr Uint256() : limbs{0, 0, 0, 0} {}
    
    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}
    
    explicit constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}
    
    /// Construct from big-endian bytes; at most 32 bytes are used
    static Uint256 FromBigEndian(const Byte* data, size_t len);
    
    /// Parse up to 64 hex digits, optional "0x". Throws std::invalid_argument.
    static Uint256 FromHex(const std::string& hex);
    
    /// 64 lowercase hex digits, no prefix
    std::string ToHex() const;
    
    /// 32 bytes, most significant first
    std::array<Byte, 32> ToBigEndian() const;
    
    bool IsZero() const;
    
    bool operator==(const Uint256& other) const;
    bool operator!=(const Uint256& other) const;
    bool operator<(const Uint256& other) const;
    bool operator>=(const Uint256& other) const;
    
    Uint256 operator>>(int shift) const;
};

// ============================================================================
// Field Element over BN254 scalar field
// ============================================================================

/**
 * Canonical element of the BN254 scalar field.
 * 
 * p = 21888242871839275222246405745257275088548364400416034343698204186575808495617
 * 
 * The stored value is always below the modulus; values that are not are
 * rejected at construction rather than silently reduced, so two distinct
 * encodings can never name the same nullifier.
 */
class FieldElement {
public:
    /// The BN254 scalar field modulus
    static const Uint256 MODULUS;
    
    /// Zero
    FieldElement() = default;
    
    explicit FieldElement(uint64_t val) : value_(val) {}
    
    /// Returns nullopt if val >= MODULUS
    static std::optional<FieldElement> FromUint256(const Uint256& val);
    
    /// Returns nullopt on malformed hex or a non-canonical value
    static std::optional<FieldElement> FromHex(const std::string& hex);
    
    const Uint256& ToUint256() const { return value_; }
    
    /// 32 bytes, big-endian
    std::array<Byte, 32> ToBytes() const { return value_.ToBigEndian(); }
    
    /// "0x"-prefixed, 64 hex digits
    std::string ToHex() const;
    
    bool IsZero() const { return value_.IsZero(); }
    
    bool operator==(const FieldElement& other) const { return value_ == other.value_; }
    bool operator!=(const FieldElement& other) const { return value_ != other.value_; }
    bool operator<(const FieldElement& other) const { return value_ < other.value_; }

private:
    Uint256 value_;
};

} // namespace zkdrop

#endif // ZKDROP_CRYPTO_FIELD_H
