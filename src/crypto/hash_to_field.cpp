// ZKDROP - Hashing Into the Scalar Field Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include "zkdrop/crypto/hash_to_field.h"
#include <openssl/evp.h>
#include <stdexcept>

namespace zkdrop {

// ============================================================================
// SHA3_256 Implementation
// ============================================================================

class SHA3_256::Impl {
public:
    Impl() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        Init();
    }
    
    ~Impl() {
        EVP_MD_CTX_free(ctx_);
    }
    
    void Init() {
        if (EVP_DigestInit_ex(ctx_, EVP_sha3_256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha3-256) failed");
        }
    }
    
    void Update(const Byte* data, size_t len) {
        if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }
    
    void Final(Byte* out) {
        unsigned int outLen = 0;
        if (EVP_DigestFinal_ex(ctx_, out, &outLen) != 1 ||
            outLen != SHA3_256::OUTPUT_SIZE) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
    }

private:
    EVP_MD_CTX* ctx_;
};

SHA3_256::SHA3_256() : impl_(std::make_unique<Impl>()) {}

SHA3_256::~SHA3_256() = default;

SHA3_256& SHA3_256::Write(const Byte* data, size_t len) {
    impl_->Update(data, len);
    return *this;
}

void SHA3_256::Finalize(Byte hash[OUTPUT_SIZE]) {
    impl_->Final(hash);
}

SHA3_256& SHA3_256::Reset() {
    impl_->Init();
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA3Hash(const Byte* data, size_t len) {
    Hash256 result;
    SHA3_256().Write(data, len).Finalize(result.data());
    return result;
}

FieldElement HashToField(const Byte* data, size_t len) {
    Hash256 digest = SHA3Hash(data, len);
    Uint256 shifted = Uint256::FromBigEndian(digest.data(), digest.size()) >> 8;
    
    // 248 bits can never reach the 254-bit modulus
    return *FieldElement::FromUint256(shifted);
}

FieldElement ComputeSignal(const Address& receiver) {
    return HashToField(receiver.data(), receiver.size());
}

FieldElement ComputeExternalNullifier(const Address& contract, AirdropId airdropId) {
    std::vector<Byte> preimage(contract.begin(), contract.end());
    
    std::array<Byte, 32> id{};
    for (size_t i = 0; i < 8; ++i) {
        id[31 - i] = static_cast<Byte>(airdropId >> (8 * i));
    }
    preimage.insert(preimage.end(), id.begin(), id.end());
    
    return HashToField(preimage);
}

} // namespace zkdrop
