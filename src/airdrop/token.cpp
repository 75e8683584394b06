// ZKDROP - Token Transfer Adapter Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <zkdrop/airdrop/token.h>
#include <zkdrop/util/logging.h>

#include <limits>

namespace zkdrop {
namespace airdrop {

TokenLedger::TokenLedger(const Address& spender) : spender_(spender) {}

bool TokenLedger::Mint(const Address& token, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount& balance = balances_[{token, to}];
    if (balance > std::numeric_limits<Amount>::max() - amount) {
        return false;
    }
    balance += amount;
    LOG_DEBUG(util::LogCategory::TOKEN) << "Minted " << amount << " of " << token.ToString()
                                        << " to " << to.ToString();
    return true;
}

Amount TokenLedger::BalanceOf(const Address& token, const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find({token, owner});
    return it == balances_.end() ? 0 : it->second;
}

void TokenLedger::Approve(const Address& token, const Address& owner,
                          const Address& spender, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    allowances_[AllowanceKey{token, owner, spender}] = amount;
}

Amount TokenLedger::Allowance(const Address& token, const Address& owner,
                              const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find(AllowanceKey{token, owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

TransferResult TokenLedger::TransferFrom(const Address& token,
                                         const Address& from,
                                         const Address& to,
                                         Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto allowanceIt = allowances_.find(AllowanceKey{token, from, spender_});
    Amount allowance = allowanceIt == allowances_.end() ? 0 : allowanceIt->second;
    if (allowance < amount) {
        LOG_DEBUG(util::LogCategory::TOKEN) << "Transfer of " << amount << " from "
                                            << from.ToString() << " exceeds allowance "
                                            << allowance;
        return TransferResult::Failure("insufficient allowance");
    }
    
    auto fromIt = balances_.find({token, from});
    Amount fromBalance = fromIt == balances_.end() ? 0 : fromIt->second;
    if (fromBalance < amount) {
        LOG_DEBUG(util::LogCategory::TOKEN) << "Transfer of " << amount << " from "
                                            << from.ToString() << " exceeds balance "
                                            << fromBalance;
        return TransferResult::Failure("insufficient balance");
    }
    
    if (from != to) {
        auto toIt = balances_.find({token, to});
        Amount toBalance = toIt == balances_.end() ? 0 : toIt->second;
        if (toBalance > std::numeric_limits<Amount>::max() - amount) {
            return TransferResult::Failure("receiver balance overflow");
        }
        balances_[{token, from}] = fromBalance - amount;
        balances_[{token, to}] = toBalance + amount;
    }
    
    if (allowanceIt != allowances_.end()) {
        allowanceIt->second -= amount;
    }
    
    LOG_DEBUG(util::LogCategory::TOKEN) << "Transferred " << amount << " of "
                                        << token.ToString() << " from " << from.ToString()
                                        << " to " << to.ToString();
    return TransferResult::Success();
}

} // namespace airdrop
} // namespace zkdrop
