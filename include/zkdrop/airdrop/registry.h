// ZKDROP - Airdrop Registry
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Keyed store of airdrop records with manager-gated updates.

#ifndef ZKDROP_AIRDROP_REGISTRY_H
#define ZKDROP_AIRDROP_REGISTRY_H

#include <zkdrop/airdrop/airdrop.h>
#include <zkdrop/airdrop/events.h>
#include <zkdrop/db/database.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace zkdrop {
namespace airdrop {

/**
 * Registry of airdrop records.
 * 
 * Identifiers are assigned from a counter that starts at 1 and only grows;
 * a failed create does not consume an id. A record is either absent or
 * complete, and Update replaces it as a whole. Reads return a copy taken
 * under the registry lock, so a reader never mixes fields from before and
 * after an update.
 */
class AirdropRegistry {
public:
    /// In-memory registry
    explicit AirdropRegistry(AirdropEventHub* events = nullptr);
    
    /// Registry persisted to db, which must outlive it
    AirdropRegistry(db::Database* db, AirdropEventHub* events);
    
    AirdropRegistry(const AirdropRegistry&) = delete;
    AirdropRegistry& operator=(const AirdropRegistry&) = delete;
    
    /// Read the counter and all records from the database
    db::Status Load();
    
    /**
     * Register a new airdrop managed by caller.
     * 
     * No field is validated. Succeeds unless the database write fails.
     * @return Status and the new id (0 on failure)
     */
    std::pair<AirdropStatus, AirdropId> Create(const Address& caller,
                                               GroupId groupId,
                                               const Address& token,
                                               const Address& holder,
                                               Amount amount);
    
    /// Snapshot of a record; nullopt for 0 and unassigned ids
    std::optional<AirdropRecord> Get(AirdropId id) const;
    
    /**
     * Replace a record. Unauthorized unless the record exists and caller is
     * its current manager. The replacement may name a new manager.
     */
    AirdropStatus Update(const Address& caller, AirdropId id,
                         const AirdropRecord& record);
    
    /// The id the next Create will assign
    AirdropId NextId() const;
    
    size_t Size() const;
    
    static std::string MakeDbKey(AirdropId id);

private:
    db::Database* db_;
    AirdropEventHub* events_;
    
    std::map<AirdropId, AirdropRecord> records_;
    AirdropId nextId_{FIRST_AIRDROP_ID};
    mutable std::mutex mutex_;
};

} // namespace airdrop
} // namespace zkdrop

#endif // ZKDROP_AIRDROP_REGISTRY_H
