// ZKDROP - Hashing Into the Scalar Field
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// SHA3-256 hashing and the derivations that bind a claim to a receiver and
// scope it to one airdrop of one deployment.

#ifndef ZKDROP_CRYPTO_HASH_TO_FIELD_H
#define ZKDROP_CRYPTO_HASH_TO_FIELD_H

#include <cstddef>
#include <memory>
#include <vector>
#include "zkdrop/core/types.h"
#include "zkdrop/crypto/field.h"

namespace zkdrop {

/// Incremental SHA3-256 hasher backed by OpenSSL EVP
class SHA3_256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;
    
    SHA3_256();
    ~SHA3_256();
    
    SHA3_256(const SHA3_256&) = delete;
    SHA3_256& operator=(const SHA3_256&) = delete;
    
    SHA3_256& Write(const Byte* data, size_t len);
    
    /// Write the digest; the hasher must be Reset before reuse
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    SHA3_256& Reset();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// SHA3-256 of data
Hash256 SHA3Hash(const Byte* data, size_t len);

/// SHA3-256(data) >> 8, which always fits below the BN254 modulus
FieldElement HashToField(const Byte* data, size_t len);

inline FieldElement HashToField(const std::vector<Byte>& data) {
    return HashToField(data.data(), data.size());
}

/// Signal binding a proof to the receiver of the payout
FieldElement ComputeSignal(const Address& receiver);

/**
 * External nullifier scoping a nullifier to one airdrop of one deployment.
 * 
 * Preimage is the 20-byte contract address followed by the airdrop id as a
 * 32-byte big-endian integer.
 */
FieldElement ComputeExternalNullifier(const Address& contract, AirdropId airdropId);

} // namespace zkdrop

#endif // ZKDROP_CRYPTO_HASH_TO_FIELD_H
