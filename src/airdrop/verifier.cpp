// ZKDROP - Proof Verification Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <zkdrop/airdrop/verifier.h>

#include <tuple>

namespace zkdrop {
namespace airdrop {

// ============================================================================
// SemaphoreProof
// ============================================================================

std::optional<SemaphoreProof> SemaphoreProof::FromHexStrings(
    const std::vector<std::string>& hex) {
    if (hex.size() != NUM_ELEMENTS) {
        return std::nullopt;
    }
    SemaphoreProof proof;
    for (size_t i = 0; i < NUM_ELEMENTS; ++i) {
        auto element = FieldElement::FromHex(hex[i]);
        if (!element) {
            return std::nullopt;
        }
        proof.elements[i] = *element;
    }
    return proof;
}

std::vector<std::string> SemaphoreProof::ToHexStrings() const {
    std::vector<std::string> result;
    result.reserve(NUM_ELEMENTS);
    for (const auto& element : elements) {
        result.push_back(element.ToHex());
    }
    return result;
}

// ============================================================================
// RejectAllVerifier
// ============================================================================

VerifyResult RejectAllVerifier::Verify(const FieldElement& /*root*/,
                                       GroupId /*groupId*/,
                                       const FieldElement& /*signal*/,
                                       const FieldElement& /*nullifierHash*/,
                                       const FieldElement& /*externalNullifier*/,
                                       const SemaphoreProof& /*proof*/) {
    return VerifyResult::Reject("no proof verifier configured");
}

// ============================================================================
// AllowListVerifier
// ============================================================================

bool AllowListVerifier::Statement::operator<(const Statement& other) const {
    return std::tie(root, groupId, signal, nullifierHash, externalNullifier, proof) <
           std::tie(other.root, other.groupId, other.signal, other.nullifierHash,
                    other.externalNullifier, other.proof);
}

void AllowListVerifier::Allow(const FieldElement& root,
                              GroupId groupId,
                              const FieldElement& signal,
                              const FieldElement& nullifierHash,
                              const FieldElement& externalNullifier,
                              const SemaphoreProof& proof) {
    std::lock_guard<std::mutex> lock(mutex_);
    allowed_.insert(Statement{root, groupId, signal, nullifierHash, externalNullifier, proof});
}

VerifyResult AllowListVerifier::Verify(const FieldElement& root,
                                       GroupId groupId,
                                       const FieldElement& signal,
                                       const FieldElement& nullifierHash,
                                       const FieldElement& externalNullifier,
                                       const SemaphoreProof& proof) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++calls_;
    Statement statement{root, groupId, signal, nullifierHash, externalNullifier, proof};
    if (allowed_.count(statement) == 0) {
        return VerifyResult::Reject("proof does not match any allowed statement");
    }
    return VerifyResult::Accept();
}

size_t AllowListVerifier::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allowed_.size();
}

uint64_t AllowListVerifier::CallCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

} // namespace airdrop
} // namespace zkdrop
