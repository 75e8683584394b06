// ZKDROP - Field Element Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include "zkdrop/crypto/field.h"
#include "zkdrop/core/hex.h"
#include <stdexcept>

namespace zkdrop {

// ============================================================================
// BN254 Scalar Field Constants
// ============================================================================

// In hex: 0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001
const Uint256 FieldElement::MODULUS{
    0x43e1f593f0000001ULL,  // limb 0 (least significant)
    0x2833e84879b97091ULL,  // limb 1
    0xb85045b68181585dULL,  // limb 2
    0x30644e72e131a029ULL   // limb 3 (most significant)
};

// ============================================================================
// Uint256 Implementation
// ============================================================================

Uint256 Uint256::FromBigEndian(const Byte* data, size_t len) {
    Uint256 result;
    if (len > 32) {
        data += len - 32;
        len = 32;
    }
    
    // Byte k from the end lands in limb k / 8
    for (size_t k = 0; k < len; ++k) {
        Byte b = data[len - 1 - k];
        result.limbs[k / 8] |= static_cast<uint64_t>(b) << (8 * (k % 8));
    }
    return result;
}

Uint256 Uint256::FromHex(const std::string& hex) {
    std::string h = StripHexPrefix(hex);
    if (h.empty() || h.size() > 64) {
        throw std::invalid_argument("Invalid 256-bit hex length");
    }
    
    // Pad to 64 characters
    if (h.size() < 64) {
        h = std::string(64 - h.size(), '0') + h;
    }
    
    std::vector<Byte> bytes = HexToBytes(h);
    return FromBigEndian(bytes.data(), bytes.size());
}

std::string Uint256::ToHex() const {
    auto bytes = ToBigEndian();
    return BytesToHex(bytes.data(), bytes.size());
}

std::array<Byte, 32> Uint256::ToBigEndian() const {
    std::array<Byte, 32> result;
    for (size_t k = 0; k < 32; ++k) {
        result[31 - k] = static_cast<Byte>(limbs[k / 8] >> (8 * (k % 8)));
    }
    return result;
}

bool Uint256::IsZero() const {
    return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

bool Uint256::operator==(const Uint256& other) const {
    return limbs == other.limbs;
}

bool Uint256::operator!=(const Uint256& other) const {
    return !(*this == other);
}

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] < other.limbs[i]) return true;
        if (limbs[i] > other.limbs[i]) return false;
    }
    return false;
}

bool Uint256::operator>=(const Uint256& other) const {
    return !(*this < other);
}

Uint256 Uint256::operator>>(int shift) const {
    if (shift <= 0) return *this;
    if (shift >= 256) return Uint256();
    
    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;
    
    for (int i = 0; i + limbShift < 4; ++i) {
        result.limbs[i] = limbs[i + limbShift] >> bitShift;
        if (bitShift > 0 && i + limbShift + 1 < 4) {
            result.limbs[i] |= limbs[i + limbShift + 1] << (64 - bitShift);
        }
    }
    return result;
}

// ============================================================================
// FieldElement Implementation
// ============================================================================

std::optional<FieldElement> FieldElement::FromUint256(const Uint256& val) {
    if (val >= MODULUS) {
        return std::nullopt;
    }
    FieldElement fe;
    fe.value_ = val;
    return fe;
}

std::optional<FieldElement> FieldElement::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.empty() || digits.size() > 64) {
        return std::nullopt;
    }
    if (digits.size() % 2 != 0) {
        digits = "0" + digits;
    }
    if (!IsValidHex(digits)) {
        return std::nullopt;
    }
    return FromUint256(Uint256::FromHex(digits));
}

std::string FieldElement::ToHex() const {
    return "0x" + value_.ToHex();
}

} // namespace zkdrop
