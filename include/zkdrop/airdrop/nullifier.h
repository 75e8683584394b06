// ZKDROP - Nullifier Ledger
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// The set of consumed nullifiers. It is the only replay protection: a
// nullifier accepted once is never accepted again, for any airdrop.

#ifndef ZKDROP_AIRDROP_NULLIFIER_H
#define ZKDROP_AIRDROP_NULLIFIER_H

#include <zkdrop/crypto/field.h>
#include <zkdrop/db/database.h>

#include <cstdint>
#include <mutex>
#include <set>
#include <string>

namespace zkdrop {
namespace airdrop {

/// Nullifier hash published with a membership proof
using NullifierHash = FieldElement;

/**
 * Ledger of consumed nullifiers.
 * 
 * Check and mark happen under one lock, so of two concurrent claims
 * presenting the same nullifier exactly one can win. When a database is
 * attached every mark is written through before it is reported.
 */
class NullifierLedger {
public:
    /// Result of a conditional mark
    enum class MarkResult {
        Marked,         ///< Nullifier was unused and is now consumed
        AlreadyUsed,    ///< Nullifier was consumed earlier (replay)
        StorageError    ///< Write-through failed; nothing changed
    };
    
    /// In-memory ledger
    NullifierLedger();
    
    /// Ledger persisted to db, which must outlive it
    explicit NullifierLedger(db::Database* db);
    
    NullifierLedger(const NullifierLedger&) = delete;
    NullifierLedger& operator=(const NullifierLedger&) = delete;
    
    /// Read every consumed nullifier from the database
    db::Status Load();
    
    bool IsUsed(const NullifierHash& nullifier) const;
    
    /**
     * Consume a nullifier the caller has already checked is unused.
     * @throws std::logic_error if the nullifier is already used
     */
    db::Status MarkUsed(const NullifierHash& nullifier);
    
    /// Atomic check-and-mark
    MarkResult TryMarkUsed(const NullifierHash& nullifier);
    
    /**
     * Undo a mark whose claim did not complete. Only the claim that made the
     * mark may release it.
     */
    db::Status Release(const NullifierHash& nullifier);
    
    uint64_t Size() const;
    
    /// Database key of a nullifier
    static std::string MakeDbKey(const NullifierHash& nullifier);

private:
    /// Caller holds mutex_
    db::Status InsertLocked(const NullifierHash& nullifier);
    
    db::Database* db_;
    std::set<NullifierHash> used_;
    mutable std::mutex mutex_;
};

const char* MarkResultToString(NullifierLedger::MarkResult result);

} // namespace airdrop
} // namespace zkdrop

#endif // ZKDROP_AIRDROP_NULLIFIER_H
