// ZKDROP - Token Transfer Adapter
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Pays out claims by moving fungible tokens from an airdrop's holder to the
// claimant's receiver.

#ifndef ZKDROP_AIRDROP_TOKEN_H
#define ZKDROP_AIRDROP_TOKEN_H

#include <zkdrop/core/types.h>

#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>

namespace zkdrop {
namespace airdrop {

struct TransferResult {
    bool ok{false};
    
    /// Why the transfer failed; empty on success
    std::string reason;
    
    static TransferResult Success() { return TransferResult{true, ""}; }
    static TransferResult Failure(const std::string& why) { return TransferResult{false, why}; }
};

/**
 * Moves `amount` of `token` from `from` to `to` on behalf of the airdrop
 * contract. Either the whole transfer happens or nothing does.
 */
class TokenTransferAdapter {
public:
    virtual ~TokenTransferAdapter() = default;
    
    virtual TransferResult TransferFrom(const Address& token,
                                        const Address& from,
                                        const Address& to,
                                        Amount amount) = 0;
};

/**
 * In-process token ledger with allowance accounting.
 * 
 * Tracks balances for any number of tokens. TransferFrom spends allowance
 * that `from` granted to the spender given at construction, which is the
 * identity of the airdrop contract.
 */
class TokenLedger : public TokenTransferAdapter {
public:
    explicit TokenLedger(const Address& spender);
    
    /// Credit new tokens; false if the balance would overflow
    bool Mint(const Address& token, const Address& to, Amount amount);
    
    Amount BalanceOf(const Address& token, const Address& owner) const;
    
    /// Set (not add to) the allowance of spender over owner's tokens
    void Approve(const Address& token, const Address& owner,
                 const Address& spender, Amount amount);
    
    Amount Allowance(const Address& token, const Address& owner,
                     const Address& spender) const;
    
    TransferResult TransferFrom(const Address& token,
                                const Address& from,
                                const Address& to,
                                Amount amount) override;
    
    const Address& Spender() const { return spender_; }

private:
    using BalanceKey = std::pair<Address, Address>;              // token, owner
    using AllowanceKey = std::tuple<Address, Address, Address>;  // token, owner, spender
    
    Address spender_;
    std::map<BalanceKey, Amount> balances_;
    std::map<AllowanceKey, Amount> allowances_;
    mutable std::mutex mutex_;
};

} // namespace airdrop
} // namespace zkdrop

#endif // ZKDROP_AIRDROP_TOKEN_H
