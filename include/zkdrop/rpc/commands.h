// ZKDROP - RPC Commands
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Airdrop RPC commands.
//
// Categories:
// - Airdrop: createairdrop, updateairdropdetails, getairdrop, getairdropcount
// - Claim: claim, isnullifierused
// - Utility: help

#ifndef ZKDROP_RPC_COMMANDS_H
#define ZKDROP_RPC_COMMANDS_H

#include <zkdrop/airdrop/airdrop.h>
#include <zkdrop/airdrop/verifier.h>
#include <zkdrop/crypto/field.h>
#include <zkdrop/rpc/server.h>

#include <string>
#include <vector>

namespace zkdrop {
namespace airdrop { class AirdropService; }

namespace rpc {

// ============================================================================
// Command Categories
// ============================================================================

namespace Category {
    constexpr const char* AIRDROP = "Airdrop";
    constexpr const char* CLAIM = "Claim";
    constexpr const char* UTILITY = "Utility";
}

// ============================================================================
// RPC Command Table - Registration
// ============================================================================

/**
 * Builds the airdrop command set and holds the service the commands act on.
 */
class RPCCommandTable {
public:
    RPCCommandTable();
    ~RPCCommandTable();
    
    /// Service the commands operate on; not owned
    void SetAirdropService(airdrop::AirdropService* service);
    
    /// Register all commands with the server
    void RegisterCommands(RPCServer& server);
    
    std::vector<RPCMethod> GetAllCommands() const;
    std::vector<RPCMethod> GetCommandsByCategory(const std::string& category) const;
    
    airdrop::AirdropService* GetAirdropService() const { return service_; }

private:
    void RegisterAirdropCommands();
    void RegisterClaimCommands();
    void RegisterUtilityCommands();
    
    std::vector<RPCMethod> commands_;
    airdrop::AirdropService* service_{nullptr};
};

// ============================================================================
// Airdrop Commands
// ============================================================================

/// Params: groupId, token, holder, amount. Caller becomes the manager.
/// Returns: the new airdrop id
RPCResponse cmd_createairdrop(const RPCRequest& req, const RPCContext& ctx,
                              RPCCommandTable* table);

/// Params: airdropId, groupId, token, manager, holder, amount
RPCResponse cmd_updateairdropdetails(const RPCRequest& req, const RPCContext& ctx,
                                     RPCCommandTable* table);

RPCResponse cmd_getairdrop(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table);

/// Number of airdrops ever created
RPCResponse cmd_getairdropcount(const RPCRequest& req, const RPCContext& ctx,
                                RPCCommandTable* table);

// ============================================================================
// Claim Commands
// ============================================================================

/// Params: airdropId, receiver, root, nullifierHash, proof (8 field elements)
RPCResponse cmd_claim(const RPCRequest& req, const RPCContext& ctx,
                      RPCCommandTable* table);

RPCResponse cmd_isnullifierused(const RPCRequest& req, const RPCContext& ctx,
                                RPCCommandTable* table);

// ============================================================================
// Utility Commands
// ============================================================================

RPCResponse cmd_help(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table);

// ============================================================================
// Helper Functions
// ============================================================================

/// JSON-RPC error code for a failed airdrop operation
int AirdropErrorToRPCCode(airdrop::AirdropError error);

/// Error response carrying the status message
RPCResponse AirdropStatusToResponse(const airdrop::AirdropStatus& status, const JSONValue& id);

JSONValue AirdropRecordToJSON(AirdropId id, const airdrop::AirdropRecord& record);

/// Non-negative integer or decimal string. Throws std::invalid_argument.
uint64_t ParseUInt64(const JSONValue& value, const std::string& name);

/// Parameter by position (array params) or by name (object params)
const JSONValue& GetParamValue(const RPCRequest& req, size_t index, const std::string& name);

/// Get required parameter; throws std::invalid_argument if missing or malformed
template<typename T>
T GetRequiredParam(const RPCRequest& req, size_t index, const std::string& name);

template<>
std::string GetRequiredParam<std::string>(const RPCRequest& req, size_t index,
                                          const std::string& name);
template<>
uint64_t GetRequiredParam<uint64_t>(const RPCRequest& req, size_t index,
                                    const std::string& name);
template<>
Address GetRequiredParam<Address>(const RPCRequest& req, size_t index,
                                  const std::string& name);
template<>
FieldElement GetRequiredParam<FieldElement>(const RPCRequest& req, size_t index,
                                            const std::string& name);
template<>
airdrop::SemaphoreProof GetRequiredParam<airdrop::SemaphoreProof>(const RPCRequest& req,
                                                                  size_t index,
                                                                  const std::string& name);

} // namespace rpc
} // namespace zkdrop

#endif // ZKDROP_RPC_COMMANDS_H
