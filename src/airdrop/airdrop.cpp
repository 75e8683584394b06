// ZKDROP - Airdrop Records and Status Codes Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <zkdrop/airdrop/airdrop.h>

#include <ios>
#include <sstream>

namespace zkdrop {
namespace airdrop {

// ============================================================================
// AirdropRecord
// ============================================================================

std::string AirdropRecord::ToString() const {
    std::ostringstream ss;
    ss << "AirdropRecord{"
       << "group=" << groupId
       << ", token=" << token.ToString()
       << ", manager=" << manager.ToString()
       << ", holder=" << holder.ToString()
       << ", amount=" << amount
       << "}";
    return ss.str();
}

std::string AirdropRecord::Encode() const {
    DataStream ss;
    Serialize(ss);
    return ss.Str();
}

std::optional<AirdropRecord> AirdropRecord::Decode(const std::string& data) {
    try {
        DataStream ss(data);
        AirdropRecord record;
        record.Unserialize(ss);
        if (!ss.empty()) {
            return std::nullopt;
        }
        return record;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

// ============================================================================
// Status
// ============================================================================

const char* AirdropErrorToString(AirdropError error) {
    switch (error) {
        case AirdropError::Ok: return "Ok";
        case AirdropError::Unauthorized: return "Unauthorized";
        case AirdropError::InvalidNullifier: return "InvalidNullifier";
        case AirdropError::InvalidAirdrop: return "InvalidAirdrop";
        case AirdropError::InvalidProof: return "InvalidProof";
        case AirdropError::TransferFailed: return "TransferFailed";
        case AirdropError::StorageError: return "StorageError";
        default: return "Unknown";
    }
}

std::string AirdropStatus::ToString() const {
    std::string result = AirdropErrorToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace airdrop
} // namespace zkdrop
