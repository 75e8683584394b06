// ZKDROP - Airdrop Service
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Caller-facing surface of an airdrop deployment. Wires the registry, the
// nullifier ledger, the claim engine and the event hub to one store.

#ifndef ZKDROP_AIRDROP_SERVICE_H
#define ZKDROP_AIRDROP_SERVICE_H

#include <zkdrop/airdrop/claim.h>
#include <zkdrop/airdrop/events.h>
#include <zkdrop/airdrop/nullifier.h>
#include <zkdrop/airdrop/registry.h>
#include <zkdrop/db/database.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace zkdrop {

namespace util {
class ConfigManager;
}

namespace airdrop {

/**
 * One airdrop deployment.
 * 
 * Owns its state; borrows the proof verifier and the token adapter, which
 * must outlive it. All operations are safe to call concurrently.
 */
class AirdropService {
public:
    struct Options {
        /// Directory holding the database; ignored when inMemory
        std::string dataDir;
        
        /// Identity of this deployment, mixed into every external nullifier
        Address contract;
        
        /// Keep all state in memory instead of LevelDB
        bool inMemory{false};
        
        /// LevelDB block cache
        size_t dbCacheMiB{8};
        
        /**
         * Read datadir, contract, memory and dbcache.
         * @return nullopt with *error set if a value is malformed
         */
        static std::optional<Options> FromConfig(const util::ConfigManager& config,
                                                 std::string* error = nullptr);
    };
    
    /// Schema version written under the V key
    static constexpr uint32_t DB_VERSION = 1;
    
    /// Purely in-memory deployment with no store behind it
    AirdropService(const Address& contract,
                   ProofVerifier& verifier,
                   TokenTransferAdapter& token);
    
    ~AirdropService();
    
    AirdropService(const AirdropService&) = delete;
    AirdropService& operator=(const AirdropService&) = delete;
    
    /**
     * Open (or create) the store described by options and reload all
     * records and consumed nullifiers from it.
     */
    static std::pair<db::Status, std::unique_ptr<AirdropService>> Open(
        const Options& options,
        ProofVerifier& verifier,
        TokenTransferAdapter& token);
    
    // ========================================================================
    // Operations
    // ========================================================================
    
    /// Register an airdrop managed by caller
    std::pair<AirdropStatus, AirdropId> CreateAirdrop(const Address& caller,
                                                      GroupId groupId,
                                                      const Address& token,
                                                      const Address& holder,
                                                      Amount amount);
    
    AirdropStatus Claim(AirdropId airdropId,
                        const Address& receiver,
                        const FieldElement& root,
                        const NullifierHash& nullifierHash,
                        const SemaphoreProof& proof);
    
    AirdropStatus UpdateDetails(const Address& caller,
                                AirdropId airdropId,
                                const AirdropRecord& record);
    
    std::optional<AirdropRecord> GetAirdrop(AirdropId airdropId) const;
    
    bool IsNullifierUsed(const NullifierHash& nullifier) const;
    
    AirdropId NextAirdropId() const;
    
    // ========================================================================
    // Accessors
    // ========================================================================
    
    void AddListener(IAirdropListener* listener) { events_.AddListener(listener); }
    void RemoveListener(IAirdropListener* listener) { events_.RemoveListener(listener); }
    
    const Address& Contract() const { return engine_.Contract(); }
    
    /// Backend name, or "none" for a store-less service
    std::string StorageName() const;
    
    uint64_t ConsumedNullifiers() const { return ledger_.Size(); }

private:
    AirdropService(const Address& contract,
                   std::unique_ptr<db::Database> db,
                   ProofVerifier& verifier,
                   TokenTransferAdapter& token);
    
    /// Check or write the schema version, then reload state
    db::Status Load();
    
    // Declaration order matters: the store outlives everything using it
    std::unique_ptr<db::Database> db_;
    AirdropEventHub events_;
    AirdropRegistry registry_;
    NullifierLedger ledger_;
    ClaimEngine engine_;
};

} // namespace airdrop
} // namespace zkdrop

#endif // ZKDROP_AIRDROP_SERVICE_H
