// ZKDROP - Proof Verification
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Interface to the group-membership proof verifier and the verifiers
// shipped with the library.

#ifndef ZKDROP_AIRDROP_VERIFIER_H
#define ZKDROP_AIRDROP_VERIFIER_H

#include <zkdrop/core/types.h>
#include <zkdrop/crypto/field.h>

#include <array>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zkdrop {
namespace airdrop {

// ============================================================================
// Proof
// ============================================================================

/**
 * Membership proof as eight field elements: a (2), b (2x2) and c (2),
 * flattened in that order. The library never inspects the elements; they
 * are handed to the verifier as-is.
 */
struct SemaphoreProof {
    static constexpr size_t NUM_ELEMENTS = 8;
    
    std::array<FieldElement, NUM_ELEMENTS> elements;
    
    /// Exactly eight canonical field elements in hex, or nullopt
    static std::optional<SemaphoreProof> FromHexStrings(const std::vector<std::string>& hex);
    
    std::vector<std::string> ToHexStrings() const;
    
    bool operator==(const SemaphoreProof& other) const { return elements == other.elements; }
    bool operator!=(const SemaphoreProof& other) const { return !(*this == other); }
    bool operator<(const SemaphoreProof& other) const { return elements < other.elements; }
};

// ============================================================================
// Verifier Interface
// ============================================================================

struct VerifyResult {
    bool valid{false};
    
    /// Why the proof was rejected; empty when valid
    std::string reason;
    
    static VerifyResult Accept() { return VerifyResult{true, ""}; }
    static VerifyResult Reject(const std::string& why) { return VerifyResult{false, why}; }
};

/**
 * Verifies that a proof shows membership of `groupId` under `root`, binds
 * `signal`, and derives `nullifierHash` from `externalNullifier`.
 * 
 * Implementations must be safe to call from several threads.
 */
class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;
    
    virtual VerifyResult Verify(const FieldElement& root,
                                GroupId groupId,
                                const FieldElement& signal,
                                const FieldElement& nullifierHash,
                                const FieldElement& externalNullifier,
                                const SemaphoreProof& proof) = 0;
    
    /// Short name for logs
    virtual std::string Name() const = 0;
};

// ============================================================================
// Shipped Verifiers
// ============================================================================

/// Rejects every proof. Used when no verifier has been configured.
class RejectAllVerifier : public ProofVerifier {
public:
    VerifyResult Verify(const FieldElement& root,
                        GroupId groupId,
                        const FieldElement& signal,
                        const FieldElement& nullifierHash,
                        const FieldElement& externalNullifier,
                        const SemaphoreProof& proof) override;
    
    std::string Name() const override { return "reject-all"; }
};

/**
 * Accepts exactly the statements registered with Allow().
 * 
 * A statement is the full tuple of public inputs plus the proof, so a
 * registered proof presented for another receiver (a different signal) or
 * another airdrop (a different external nullifier) is rejected.
 */
class AllowListVerifier : public ProofVerifier {
public:
    void Allow(const FieldElement& root,
               GroupId groupId,
               const FieldElement& signal,
               const FieldElement& nullifierHash,
               const FieldElement& externalNullifier,
               const SemaphoreProof& proof);
    
    VerifyResult Verify(const FieldElement& root,
                        GroupId groupId,
                        const FieldElement& signal,
                        const FieldElement& nullifierHash,
                        const FieldElement& externalNullifier,
                        const SemaphoreProof& proof) override;
    
    std::string Name() const override { return "allow-list"; }
    
    size_t Size() const;
    
    /// Number of Verify calls so far
    uint64_t CallCount() const;

private:
    struct Statement {
        FieldElement root;
        GroupId groupId{0};
        FieldElement signal;
        FieldElement nullifierHash;
        FieldElement externalNullifier;
        SemaphoreProof proof;
        
        bool operator<(const Statement& other) const;
    };
    
    std::set<Statement> allowed_;
    uint64_t calls_{0};
    mutable std::mutex mutex_;
};

} // namespace airdrop
} // namespace zkdrop

#endif // ZKDROP_AIRDROP_VERIFIER_H
