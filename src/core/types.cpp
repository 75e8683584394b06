// ZKDROP - Core Types Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include "zkdrop/core/types.h"
#include "zkdrop/core/hex.h"

namespace zkdrop {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: expected " +
                                    std::to_string(SIZE * 2) + " digits");
    }
    
    std::vector<Byte> bytes = HexToBytes(digits);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

} // namespace zkdrop
