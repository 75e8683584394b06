// ZKDROP - Airdrop Records and Status Codes
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Defines the airdrop record kept by the registry and the status values
// returned by every state-changing airdrop operation.

#ifndef ZKDROP_AIRDROP_AIRDROP_H
#define ZKDROP_AIRDROP_AIRDROP_H

#include <zkdrop/core/types.h>
#include <zkdrop/core/serialize.h>

#include <cstdint>
#include <optional>
#include <string>

namespace zkdrop {
namespace airdrop {

// ============================================================================
// Airdrop Record
// ============================================================================

/**
 * A registered token distribution.
 * 
 * Every successful claim pays `amount` of `token` from `holder` to the
 * claimant's receiver. Only `manager` may replace the record.
 */
struct AirdropRecord {
    /// Membership group whose members may claim
    GroupId groupId{0};
    
    /// Fungible token contract
    Address token;
    
    /// Principal allowed to update this record
    Address manager;
    
    /// Principal whose balance funds payouts
    Address holder;
    
    /// Quantity paid per successful claim
    Amount amount{0};
    
    bool operator==(const AirdropRecord& other) const {
        return groupId == other.groupId && token == other.token &&
               manager == other.manager && holder == other.holder &&
               amount == other.amount;
    }
    
    bool operator!=(const AirdropRecord& other) const {
        return !(*this == other);
    }
    
    std::string ToString() const;
    
    template<typename Stream>
    void Serialize(Stream& s) const {
        ::zkdrop::Serialize(s, RECORD_VERSION);
        ::zkdrop::Serialize(s, groupId);
        ::zkdrop::Serialize(s, token);
        ::zkdrop::Serialize(s, manager);
        ::zkdrop::Serialize(s, holder);
        ::zkdrop::Serialize(s, amount);
    }
    
    /// Throws std::ios_base::failure on truncated or unknown-version data
    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t version = 0;
        ::zkdrop::Unserialize(s, version);
        if (version != RECORD_VERSION) {
            throw std::ios_base::failure("unknown airdrop record version " +
                                         std::to_string(version));
        }
        ::zkdrop::Unserialize(s, groupId);
        ::zkdrop::Unserialize(s, token);
        ::zkdrop::Unserialize(s, manager);
        ::zkdrop::Unserialize(s, holder);
        ::zkdrop::Unserialize(s, amount);
    }
    
    /// Encoded form stored in the database
    std::string Encode() const;
    
    static std::optional<AirdropRecord> Decode(const std::string& data);
    
    static constexpr uint8_t RECORD_VERSION = 1;
};

// ============================================================================
// Status
// ============================================================================

/// Outcome of an airdrop operation
enum class AirdropError {
    Ok = 0,
    
    /// Caller is not the manager of the record (update)
    Unauthorized,
    
    /// Nullifier already consumed (replay)
    InvalidNullifier,
    
    /// Airdrop id is 0 or was never assigned
    InvalidAirdrop,
    
    /// Proof verifier rejected the claim
    InvalidProof,
    
    /// Token transfer adapter rejected the payout
    TransferFailed,
    
    /// Persisting the new state failed
    StorageError,
};

const char* AirdropErrorToString(AirdropError error);

/**
 * Error code plus a human-readable detail message.
 */
class AirdropStatus {
public:
    AirdropStatus() : code_(AirdropError::Ok) {}
    AirdropStatus(AirdropError code, const std::string& msg = "")
        : code_(code), message_(msg) {}
    
    static AirdropStatus Ok() { return AirdropStatus(); }
    static AirdropStatus Unauthorized(const std::string& msg = "") {
        return AirdropStatus(AirdropError::Unauthorized, msg);
    }
    static AirdropStatus InvalidNullifier(const std::string& msg = "") {
        return AirdropStatus(AirdropError::InvalidNullifier, msg);
    }
    static AirdropStatus InvalidAirdrop(const std::string& msg = "") {
        return AirdropStatus(AirdropError::InvalidAirdrop, msg);
    }
    static AirdropStatus InvalidProof(const std::string& msg = "") {
        return AirdropStatus(AirdropError::InvalidProof, msg);
    }
    static AirdropStatus TransferFailed(const std::string& msg = "") {
        return AirdropStatus(AirdropError::TransferFailed, msg);
    }
    static AirdropStatus StorageError(const std::string& msg = "") {
        return AirdropStatus(AirdropError::StorageError, msg);
    }
    
    bool ok() const { return code_ == AirdropError::Ok; }
    AirdropError code() const { return code_; }
    const std::string& message() const { return message_; }
    
    /// "InvalidProof: <message>"
    std::string ToString() const;

private:
    AirdropError code_;
    std::string message_;
};

} // namespace airdrop
} // namespace zkdrop

#endif // ZKDROP_AIRDROP_AIRDROP_H
