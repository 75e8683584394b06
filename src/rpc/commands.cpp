// ZKDROP - RPC Commands Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <zkdrop/rpc/commands.h>
#include <zkdrop/airdrop/service.h>
#include <zkdrop/util/logging.h>

#include <map>
#include <stdexcept>

namespace zkdrop {
namespace rpc {

namespace {

std::string ParamLabel(size_t index, const std::string& name) {
    return name + " (position " + std::to_string(index) + ")";
}

RPCResponse ServiceUnavailable(const JSONValue& id) {
    return InternalError("Airdrop service not available", id);
}

} // namespace

// ============================================================================
// Parameter Helpers
// ============================================================================

const JSONValue& GetParamValue(const RPCRequest& req, size_t index, const std::string& name) {
    if (req.GetParams().IsObject()) {
        return req.GetParam(name);
    }
    return req.GetParam(index);
}

uint64_t ParseUInt64(const JSONValue& value, const std::string& name) {
    if (value.IsInt()) {
        if (value.GetInt() < 0) {
            throw std::invalid_argument("Parameter must be non-negative: " + name);
        }
        return static_cast<uint64_t>(value.GetInt());
    }
    if (value.IsString()) {
        const std::string& str = value.GetString();
        if (str.empty() || str.size() > 20 ||
            str.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Parameter must be a decimal integer: " + name);
        }
        try {
            return std::stoull(str);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Parameter out of range: " + name);
        }
    }
    throw std::invalid_argument("Parameter must be integer: " + name);
}

template<>
std::string GetRequiredParam<std::string>(const RPCRequest& req, size_t index,
                                          const std::string& name) {
    const JSONValue& param = GetParamValue(req, index, name);
    if (param.IsNull()) {
        throw std::invalid_argument("Missing required parameter: " + ParamLabel(index, name));
    }
    if (!param.IsString()) {
        throw std::invalid_argument("Parameter must be string: " + name);
    }
    return param.GetString();
}

template<>
uint64_t GetRequiredParam<uint64_t>(const RPCRequest& req, size_t index,
                                    const std::string& name) {
    const JSONValue& param = GetParamValue(req, index, name);
    if (param.IsNull()) {
        throw std::invalid_argument("Missing required parameter: " + ParamLabel(index, name));
    }
    return ParseUInt64(param, name);
}

template<>
Address GetRequiredParam<Address>(const RPCRequest& req, size_t index,
                                  const std::string& name) {
    std::string hex = GetRequiredParam<std::string>(req, index, name);
    try {
        return Address::FromHex(hex);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("Invalid address for " + name + ": " + e.what());
    }
}

template<>
FieldElement GetRequiredParam<FieldElement>(const RPCRequest& req, size_t index,
                                            const std::string& name) {
    std::string hex = GetRequiredParam<std::string>(req, index, name);
    auto element = FieldElement::FromHex(hex);
    if (!element) {
        throw std::invalid_argument("Parameter is not a field element: " + name);
    }
    return *element;
}

template<>
airdrop::SemaphoreProof GetRequiredParam<airdrop::SemaphoreProof>(const RPCRequest& req,
                                                                  size_t index,
                                                                  const std::string& name) {
    const JSONValue& param = GetParamValue(req, index, name);
    if (param.IsNull()) {
        throw std::invalid_argument("Missing required parameter: " + ParamLabel(index, name));
    }
    if (!param.IsArray()) {
        throw std::invalid_argument("Parameter must be an array: " + name);
    }
    
    std::vector<std::string> hex;
    for (const auto& item : param.GetArray()) {
        if (!item.IsString()) {
            throw std::invalid_argument("Proof elements must be hex strings");
        }
        hex.push_back(item.GetString());
    }
    
    auto proof = airdrop::SemaphoreProof::FromHexStrings(hex);
    if (!proof) {
        throw std::invalid_argument("Proof must be " +
                                    std::to_string(airdrop::SemaphoreProof::NUM_ELEMENTS) +
                                    " field elements");
    }
    return *proof;
}

// ============================================================================
// Result Helpers
// ============================================================================

int AirdropErrorToRPCCode(airdrop::AirdropError error) {
    switch (error) {
        case airdrop::AirdropError::Unauthorized: return ErrorCode::UNAUTHORIZED;
        case airdrop::AirdropError::InvalidNullifier: return ErrorCode::INVALID_NULLIFIER;
        case airdrop::AirdropError::InvalidAirdrop: return ErrorCode::INVALID_AIRDROP;
        case airdrop::AirdropError::InvalidProof: return ErrorCode::INVALID_PROOF;
        case airdrop::AirdropError::TransferFailed: return ErrorCode::TRANSFER_FAILED;
        case airdrop::AirdropError::StorageError: return ErrorCode::STORAGE_ERROR;
        case airdrop::AirdropError::Ok: break;
    }
    return ErrorCode::INTERNAL_ERROR;
}

RPCResponse AirdropStatusToResponse(const airdrop::AirdropStatus& status, const JSONValue& id) {
    std::string message = airdrop::AirdropErrorToString(status.code());
    if (!status.message().empty()) {
        message += ": " + status.message();
    }
    return RPCResponse::Error(AirdropErrorToRPCCode(status.code()), message, id);
}

JSONValue AirdropRecordToJSON(AirdropId id, const airdrop::AirdropRecord& record) {
    JSONValue::Object obj;
    obj["airdropId"] = JSONValue(id);
    obj["groupId"] = JSONValue(record.groupId);
    obj["token"] = record.token.ToString();
    obj["manager"] = record.manager.ToString();
    obj["holder"] = record.holder.ToString();
    obj["amount"] = JSONValue(record.amount);
    return JSONValue(std::move(obj));
}

// ============================================================================
// RPCCommandTable Implementation
// ============================================================================

RPCCommandTable::RPCCommandTable() {
}

RPCCommandTable::~RPCCommandTable() {
}

void RPCCommandTable::SetAirdropService(airdrop::AirdropService* service) {
    service_ = service;
}

void RPCCommandTable::RegisterCommands(RPCServer& server) {
    commands_.clear();
    RegisterAirdropCommands();
    RegisterClaimCommands();
    RegisterUtilityCommands();
    
    for (const auto& cmd : commands_) {
        server.RegisterMethod(cmd);
    }
    LOG_DEBUG(util::LogCategory::RPC) << "Registered " << commands_.size() << " RPC commands";
}

std::vector<RPCMethod> RPCCommandTable::GetAllCommands() const {
    return commands_;
}

std::vector<RPCMethod> RPCCommandTable::GetCommandsByCategory(const std::string& category) const {
    std::vector<RPCMethod> result;
    for (const auto& cmd : commands_) {
        if (cmd.category == category) {
            result.push_back(cmd);
        }
    }
    return result;
}

void RPCCommandTable::RegisterAirdropCommands() {
    RPCCommandTable* table = this;
    
    commands_.push_back({
        "createairdrop",
        Category::AIRDROP,
        "Registers a new airdrop managed by the caller and returns its id.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_createairdrop(req, ctx, table);
        },
        {"groupId", "token", "holder", "amount"},
        {"Membership group allowed to claim",
         "Token contract address",
         "Address whose balance funds the payouts",
         "Amount paid per claim"}
    });
    
    commands_.push_back({
        "updateairdropdetails",
        Category::AIRDROP,
        "Replaces an airdrop record. Only its manager may call this.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_updateairdropdetails(req, ctx, table);
        },
        {"airdropId", "groupId", "token", "manager", "holder", "amount"},
        {"Airdrop to update",
         "New membership group",
         "New token contract address",
         "New manager address",
         "New holder address",
         "New amount per claim"}
    });
    
    commands_.push_back({
        "getairdrop",
        Category::AIRDROP,
        "Returns an airdrop record.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_getairdrop(req, ctx, table);
        },
        {"airdropId"},
        {"Airdrop id"}
    });
    
    commands_.push_back({
        "getairdropcount",
        Category::AIRDROP,
        "Returns the number of airdrops created so far.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_getairdropcount(req, ctx, table);
        },
        {},
        {}
    });
}

void RPCCommandTable::RegisterClaimCommands() {
    RPCCommandTable* table = this;
    
    commands_.push_back({
        "claim",
        Category::CLAIM,
        "Claims an airdrop for a receiver with a group membership proof.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_claim(req, ctx, table);
        },
        {"airdropId", "receiver", "root", "nullifierHash", "proof"},
        {"Airdrop to claim",
         "Address receiving the tokens",
         "Merkle root of the group",
         "Nullifier hash of this claim",
         "Array of 8 proof field elements in hex"}
    });
    
    commands_.push_back({
        "isnullifierused",
        Category::CLAIM,
        "Returns whether a nullifier hash has been consumed.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_isnullifierused(req, ctx, table);
        },
        {"nullifierHash"},
        {"Nullifier hash in hex"}
    });
}

void RPCCommandTable::RegisterUtilityCommands() {
    RPCCommandTable* table = this;
    
    commands_.push_back({
        "help",
        Category::UTILITY,
        "Lists all commands, or describes one command.",
        [table](const RPCRequest& req, const RPCContext& ctx) {
            return cmd_help(req, ctx, table);
        },
        {"command"},
        {"Command to describe (optional)"}
    });
}

// ============================================================================
// Airdrop Commands
// ============================================================================

RPCResponse cmd_createairdrop(const RPCRequest& req, const RPCContext& ctx,
                              RPCCommandTable* table) {
    airdrop::AirdropService* service = table->GetAirdropService();
    if (!service) {
        return ServiceUnavailable(req.GetId());
    }
    
    GroupId groupId = GetRequiredParam<uint64_t>(req, 0, "groupId");
    Address token = GetRequiredParam<Address>(req, 1, "token");
    Address holder = GetRequiredParam<Address>(req, 2, "holder");
    Amount amount = GetRequiredParam<uint64_t>(req, 3, "amount");
    
    auto [status, id] = service->CreateAirdrop(ctx.caller, groupId, token, holder, amount);
    if (!status.ok()) {
        return AirdropStatusToResponse(status, req.GetId());
    }
    return RPCResponse::Success(JSONValue(id), req.GetId());
}

RPCResponse cmd_updateairdropdetails(const RPCRequest& req, const RPCContext& ctx,
                                     RPCCommandTable* table) {
    airdrop::AirdropService* service = table->GetAirdropService();
    if (!service) {
        return ServiceUnavailable(req.GetId());
    }
    
    AirdropId id = GetRequiredParam<uint64_t>(req, 0, "airdropId");
    
    airdrop::AirdropRecord record;
    record.groupId = GetRequiredParam<uint64_t>(req, 1, "groupId");
    record.token = GetRequiredParam<Address>(req, 2, "token");
    record.manager = GetRequiredParam<Address>(req, 3, "manager");
    record.holder = GetRequiredParam<Address>(req, 4, "holder");
    record.amount = GetRequiredParam<uint64_t>(req, 5, "amount");
    
    airdrop::AirdropStatus status = service->UpdateDetails(ctx.caller, id, record);
    if (!status.ok()) {
        return AirdropStatusToResponse(status, req.GetId());
    }
    return RPCResponse::Success(AirdropRecordToJSON(id, record), req.GetId());
}

RPCResponse cmd_getairdrop(const RPCRequest& req, const RPCContext& ctx,
                           RPCCommandTable* table) {
    airdrop::AirdropService* service = table->GetAirdropService();
    if (!service) {
        return ServiceUnavailable(req.GetId());
    }
    
    AirdropId id = GetRequiredParam<uint64_t>(req, 0, "airdropId");
    auto record = service->GetAirdrop(id);
    if (!record) {
        return AirdropStatusToResponse(
            airdrop::AirdropStatus::InvalidAirdrop("no airdrop with id " + std::to_string(id)),
            req.GetId());
    }
    return RPCResponse::Success(AirdropRecordToJSON(id, *record), req.GetId());
}

RPCResponse cmd_getairdropcount(const RPCRequest& req, const RPCContext& ctx,
                                RPCCommandTable* table) {
    airdrop::AirdropService* service = table->GetAirdropService();
    if (!service) {
        return ServiceUnavailable(req.GetId());
    }
    return RPCResponse::Success(JSONValue(service->NextAirdropId() - FIRST_AIRDROP_ID),
                                req.GetId());
}

// ============================================================================
// Claim Commands
// ============================================================================

RPCResponse cmd_claim(const RPCRequest& req, const RPCContext& ctx,
                      RPCCommandTable* table) {
    airdrop::AirdropService* service = table->GetAirdropService();
    if (!service) {
        return ServiceUnavailable(req.GetId());
    }
    
    AirdropId id = GetRequiredParam<uint64_t>(req, 0, "airdropId");
    Address receiver = GetRequiredParam<Address>(req, 1, "receiver");
    FieldElement root = GetRequiredParam<FieldElement>(req, 2, "root");
    FieldElement nullifierHash = GetRequiredParam<FieldElement>(req, 3, "nullifierHash");
    auto proof = GetRequiredParam<airdrop::SemaphoreProof>(req, 4, "proof");
    
    airdrop::AirdropStatus status = service->Claim(id, receiver, root, nullifierHash, proof);
    if (!status.ok()) {
        return AirdropStatusToResponse(status, req.GetId());
    }
    return RPCResponse::Success(JSONValue(true), req.GetId());
}

RPCResponse cmd_isnullifierused(const RPCRequest& req, const RPCContext& ctx,
                                RPCCommandTable* table) {
    airdrop::AirdropService* service = table->GetAirdropService();
    if (!service) {
        return ServiceUnavailable(req.GetId());
    }
    
    FieldElement nullifierHash = GetRequiredParam<FieldElement>(req, 0, "nullifierHash");
    return RPCResponse::Success(JSONValue(service->IsNullifierUsed(nullifierHash)),
                                req.GetId());
}

// ============================================================================
// Utility Commands
// ============================================================================

RPCResponse cmd_help(const RPCRequest& req, const RPCContext& ctx,
                     RPCCommandTable* table) {
    const JSONValue& param = GetParamValue(req, 0, "command");
    std::string command = param.IsString() ? param.GetString() : "";
    
    if (command.empty()) {
        // List all commands by category
        std::map<std::string, JSONValue::Array> byCategory;
        for (const auto& cmd : table->GetAllCommands()) {
            JSONValue::Object cmdInfo;
            cmdInfo["name"] = cmd.name;
            cmdInfo["description"] = cmd.description;
            byCategory[cmd.category].push_back(JSONValue(std::move(cmdInfo)));
        }
        
        JSONValue::Object result;
        for (auto& [category, cmds] : byCategory) {
            result[category] = JSONValue(std::move(cmds));
        }
        return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
    }
    
    for (const auto& cmd : table->GetAllCommands()) {
        if (cmd.name != command) {
            continue;
        }
        JSONValue::Object result;
        result["name"] = cmd.name;
        result["category"] = cmd.category;
        result["description"] = cmd.description;
        
        JSONValue::Array args;
        for (size_t i = 0; i < cmd.argNames.size(); ++i) {
            JSONValue::Object arg;
            arg["name"] = cmd.argNames[i];
            if (i < cmd.argDescriptions.size()) {
                arg["description"] = cmd.argDescriptions[i];
            }
            args.push_back(JSONValue(std::move(arg)));
        }
        result["arguments"] = JSONValue(std::move(args));
        return RPCResponse::Success(JSONValue(std::move(result)), req.GetId());
    }
    
    return RPCResponse::Error(ErrorCode::METHOD_NOT_FOUND,
                              "Unknown command: " + command, req.GetId());
}

} // namespace rpc
} // namespace zkdrop
