// ZKDROP - Claim Engine Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <zkdrop/airdrop/claim.h>
#include <zkdrop/crypto/hash_to_field.h>
#include <zkdrop/util/logging.h>

#include <exception>

namespace zkdrop {
namespace airdrop {

ClaimEngine::ClaimEngine(const Address& contract,
                         AirdropRegistry& registry,
                         NullifierLedger& ledger,
                         ProofVerifier& verifier,
                         TokenTransferAdapter& token,
                         AirdropEventHub* events)
    : contract_(contract)
    , registry_(registry)
    , ledger_(ledger)
    , verifier_(verifier)
    , token_(token)
    , events_(events) {}

AirdropStatus ClaimEngine::RollBack(const NullifierHash& nullifierHash,
                                    AirdropStatus failure) {
    db::Status released = ledger_.Release(nullifierHash);
    if (released.ok()) {
        return failure;
    }
    // The nullifier stays spent without a payout; report it as a storage
    // fault so the caller knows the claim cannot simply be retried
    LOG_ERROR(util::LogCategory::CLAIM) << "Could not release nullifier "
                                        << nullifierHash.ToHex() << " after "
                                        << failure.ToString() << ": " << released.ToString();
    return AirdropStatus::StorageError("nullifier " + nullifierHash.ToHex() +
                                       " still consumed after " + failure.ToString() +
                                       ": " + released.ToString());
}

AirdropStatus ClaimEngine::Claim(AirdropId airdropId,
                                 const Address& receiver,
                                 const FieldElement& root,
                                 const NullifierHash& nullifierHash,
                                 const SemaphoreProof& proof) {
    if (ledger_.IsUsed(nullifierHash)) {
        LOG_DEBUG(util::LogCategory::CLAIM) << "Claim on airdrop " << airdropId
                                            << " rejected: nullifier "
                                            << nullifierHash.ToHex() << " already used";
        return AirdropStatus::InvalidNullifier("nullifier already used");
    }
    
    // Id 0 is never assigned, so Get covers it; every later step uses
    // this one snapshot even if the record is updated meanwhile
    std::optional<AirdropRecord> record = registry_.Get(airdropId);
    if (!record) {
        LOG_DEBUG(util::LogCategory::CLAIM) << "Claim rejected: no airdrop " << airdropId;
        return AirdropStatus::InvalidAirdrop("no airdrop with id " + std::to_string(airdropId));
    }
    
    const FieldElement signal = ComputeSignal(receiver);
    const FieldElement externalNullifier = ComputeExternalNullifier(contract_, airdropId);
    
    VerifyResult verified = verifier_.Verify(root, record->groupId, signal, nullifierHash,
                                             externalNullifier, proof);
    if (!verified.valid) {
        LOG_DEBUG(util::LogCategory::CLAIM) << "Claim on airdrop " << airdropId
                                            << " rejected by " << verifier_.Name() << ": "
                                            << verified.reason;
        return AirdropStatus::InvalidProof(verified.reason);
    }
    
    switch (ledger_.TryMarkUsed(nullifierHash)) {
        case NullifierLedger::MarkResult::Marked:
            break;
        case NullifierLedger::MarkResult::AlreadyUsed:
            LOG_DEBUG(util::LogCategory::CLAIM) << "Claim on airdrop " << airdropId
                                                << " lost race for nullifier "
                                                << nullifierHash.ToHex();
            return AirdropStatus::InvalidNullifier("nullifier already used");
        case NullifierLedger::MarkResult::StorageError:
            return AirdropStatus::StorageError("failed to persist nullifier");
    }
    
    TransferResult transfer;
    try {
        transfer = token_.TransferFrom(record->token, record->holder, receiver, record->amount);
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::CLAIM) << "Token adapter threw during claim on airdrop "
                                            << airdropId << ": " << e.what();
        transfer = TransferResult::Failure(e.what());
    }
    if (!transfer.ok) {
        LOG_DEBUG(util::LogCategory::CLAIM) << "Claim on airdrop " << airdropId
                                            << " transfer failed: " << transfer.reason;
        return RollBack(nullifierHash, AirdropStatus::TransferFailed(transfer.reason));
    }
    
    LOG_INFO(util::LogCategory::CLAIM) << "Airdrop " << airdropId << " paid "
                                       << record->amount << " to " << receiver.ToString();
    if (events_) {
        events_->NotifyClaimed(AirdropClaimed{airdropId, receiver});
    }
    return AirdropStatus::Ok();
}

} // namespace airdrop
} // namespace zkdrop
