// ZKDROP - Token Ledger Tests
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <gtest/gtest.h>

#include <zkdrop/airdrop/token.h>

#include <limits>

namespace zkdrop {
namespace airdrop {
namespace {

Address MakeAddress(Byte last) {
    Address addr;
    addr[Address::SIZE - 1] = last;
    return addr;
}

class TokenLedgerTest : public ::testing::Test {
protected:
    TokenLedgerTest()
        : contract_(MakeAddress(0xc0))
        , token_(MakeAddress(0x01))
        , otherToken_(MakeAddress(0x02))
        , holder_(MakeAddress(0x10))
        , receiver_(MakeAddress(0x20))
        , ledger_(contract_) {}

    Address contract_;
    Address token_;
    Address otherToken_;
    Address holder_;
    Address receiver_;
    TokenLedger ledger_;
};

TEST_F(TokenLedgerTest, InitialState) {
    EXPECT_EQ(ledger_.Spender(), contract_);
    EXPECT_EQ(ledger_.BalanceOf(token_, holder_), 0u);
    EXPECT_EQ(ledger_.Allowance(token_, holder_, contract_), 0u);
}

TEST_F(TokenLedgerTest, MintCredits) {
    EXPECT_TRUE(ledger_.Mint(token_, holder_, 100));
    EXPECT_TRUE(ledger_.Mint(token_, holder_, 50));
    EXPECT_EQ(ledger_.BalanceOf(token_, holder_), 150u);
    EXPECT_EQ(ledger_.BalanceOf(otherToken_, holder_), 0u);
}

TEST_F(TokenLedgerTest, MintOverflowIsRejected) {
    const Amount max = std::numeric_limits<Amount>::max();
    ASSERT_TRUE(ledger_.Mint(token_, holder_, max));
    EXPECT_FALSE(ledger_.Mint(token_, holder_, 1));
    EXPECT_EQ(ledger_.BalanceOf(token_, holder_), max);
}

TEST_F(TokenLedgerTest, ApproveSetsAllowance) {
    ledger_.Approve(token_, holder_, contract_, 100);
    EXPECT_EQ(ledger_.Allowance(token_, holder_, contract_), 100u);

    ledger_.Approve(token_, holder_, contract_, 30);
    EXPECT_EQ(ledger_.Allowance(token_, holder_, contract_), 30u);
    EXPECT_EQ(ledger_.Allowance(otherToken_, holder_, contract_), 0u);
}

TEST_F(TokenLedgerTest, TransferFromMovesTokensAndSpendsAllowance) {
    ASSERT_TRUE(ledger_.Mint(token_, holder_, 1000));
    ledger_.Approve(token_, holder_, contract_, 300);

    TransferResult result = ledger_.TransferFrom(token_, holder_, receiver_, 100);
    ASSERT_TRUE(result.ok) << result.reason;
    EXPECT_TRUE(result.reason.empty());

    EXPECT_EQ(ledger_.BalanceOf(token_, holder_), 900u);
    EXPECT_EQ(ledger_.BalanceOf(token_, receiver_), 100u);
    EXPECT_EQ(ledger_.Allowance(token_, holder_, contract_), 200u);
}

TEST_F(TokenLedgerTest, InsufficientAllowance) {
    ASSERT_TRUE(ledger_.Mint(token_, holder_, 1000));
    ledger_.Approve(token_, holder_, contract_, 50);

    TransferResult result = ledger_.TransferFrom(token_, holder_, receiver_, 100);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.reason, "insufficient allowance");
    EXPECT_EQ(ledger_.BalanceOf(token_, holder_), 1000u);
    EXPECT_EQ(ledger_.BalanceOf(token_, receiver_), 0u);
    EXPECT_EQ(ledger_.Allowance(token_, holder_, contract_), 50u);
}

TEST_F(TokenLedgerTest, AllowanceForAnotherSpenderDoesNotCount) {
    ASSERT_TRUE(ledger_.Mint(token_, holder_, 1000));
    ledger_.Approve(token_, holder_, MakeAddress(0xee), 1000);

    TransferResult result = ledger_.TransferFrom(token_, holder_, receiver_, 1);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.reason, "insufficient allowance");
}

TEST_F(TokenLedgerTest, InsufficientBalance) {
    ASSERT_TRUE(ledger_.Mint(token_, holder_, 10));
    ledger_.Approve(token_, holder_, contract_, 1000);

    TransferResult result = ledger_.TransferFrom(token_, holder_, receiver_, 100);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.reason, "insufficient balance");
    EXPECT_EQ(ledger_.BalanceOf(token_, holder_), 10u);
    EXPECT_EQ(ledger_.Allowance(token_, holder_, contract_), 1000u);
}

TEST_F(TokenLedgerTest, ReceiverOverflow) {
    const Amount max = std::numeric_limits<Amount>::max();
    ASSERT_TRUE(ledger_.Mint(token_, holder_, 10));
    ASSERT_TRUE(ledger_.Mint(token_, receiver_, max));
    ledger_.Approve(token_, holder_, contract_, 10);

    TransferResult result = ledger_.TransferFrom(token_, holder_, receiver_, 1);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.reason, "receiver balance overflow");
    EXPECT_EQ(ledger_.BalanceOf(token_, holder_), 10u);
    EXPECT_EQ(ledger_.Allowance(token_, holder_, contract_), 10u);
}

TEST_F(TokenLedgerTest, ZeroAmountTransfer) {
    TransferResult result = ledger_.TransferFrom(token_, holder_, receiver_, 0);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(ledger_.BalanceOf(token_, receiver_), 0u);
}

TEST_F(TokenLedgerTest, SelfTransferKeepsBalanceAndSpendsAllowance) {
    ASSERT_TRUE(ledger_.Mint(token_, holder_, 100));
    ledger_.Approve(token_, holder_, contract_, 100);

    ASSERT_TRUE(ledger_.TransferFrom(token_, holder_, holder_, 40).ok);
    EXPECT_EQ(ledger_.BalanceOf(token_, holder_), 100u);
    EXPECT_EQ(ledger_.Allowance(token_, holder_, contract_), 60u);
}

TEST_F(TokenLedgerTest, TokensAreIndependent) {
    ASSERT_TRUE(ledger_.Mint(token_, holder_, 100));
    ASSERT_TRUE(ledger_.Mint(otherToken_, holder_, 100));
    ledger_.Approve(token_, holder_, contract_, 100);

    EXPECT_TRUE(ledger_.TransferFrom(token_, holder_, receiver_, 100).ok);
    EXPECT_FALSE(ledger_.TransferFrom(otherToken_, holder_, receiver_, 100).ok);
    EXPECT_EQ(ledger_.BalanceOf(otherToken_, holder_), 100u);
}

} // namespace
} // namespace airdrop
} // namespace zkdrop
