// ZKDROP - Claim Engine
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Validates an anonymous claim, spends its nullifier and pays out.

#ifndef ZKDROP_AIRDROP_CLAIM_H
#define ZKDROP_AIRDROP_CLAIM_H

#include <zkdrop/airdrop/airdrop.h>
#include <zkdrop/airdrop/events.h>
#include <zkdrop/airdrop/nullifier.h>
#include <zkdrop/airdrop/registry.h>
#include <zkdrop/airdrop/token.h>
#include <zkdrop/airdrop/verifier.h>

namespace zkdrop {
namespace airdrop {

/**
 * Processes claims against a registry.
 * 
 * A claim either fully succeeds (nullifier consumed, tokens transferred,
 * AirdropClaimed published) or changes nothing. Concurrent claims carrying
 * the same nullifier are serialized by the ledger's check-and-mark, so at
 * most one of them pays out.
 * 
 * All collaborators are borrowed and must outlive the engine.
 */
class ClaimEngine {
public:
    ClaimEngine(const Address& contract,
                AirdropRegistry& registry,
                NullifierLedger& ledger,
                ProofVerifier& verifier,
                TokenTransferAdapter& token,
                AirdropEventHub* events = nullptr);
    
    /**
     * Claim airdrop `airdropId` for `receiver`.
     * 
     * Checks, in order: nullifier unused (InvalidNullifier), airdrop exists
     * (InvalidAirdrop), proof valid (InvalidProof). Then consumes the
     * nullifier and transfers the record's amount from its holder. A failed
     * or throwing transfer releases the nullifier and returns TransferFailed;
     * if the release cannot be persisted the result is StorageError.
     */
    AirdropStatus Claim(AirdropId airdropId,
                        const Address& receiver,
                        const FieldElement& root,
                        const NullifierHash& nullifierHash,
                        const SemaphoreProof& proof);
    
    const Address& Contract() const { return contract_; }

private:
    /// Undo the nullifier mark of an unpaid claim and return `failure`
    AirdropStatus RollBack(const NullifierHash& nullifierHash, AirdropStatus failure);
    
    Address contract_;
    AirdropRegistry& registry_;
    NullifierLedger& ledger_;
    ProofVerifier& verifier_;
    TokenTransferAdapter& token_;
    AirdropEventHub* events_;
};

} // namespace airdrop
} // namespace zkdrop

#endif // ZKDROP_AIRDROP_CLAIM_H
