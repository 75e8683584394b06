// ZKDROP - Hash-to-Field Tests
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <gtest/gtest.h>
#include "zkdrop/crypto/hash_to_field.h"

#include <set>
#include <string>

namespace zkdrop {
namespace test {

namespace {

std::vector<Byte> Bytes(const std::string& s) {
    return std::vector<Byte>(s.begin(), s.end());
}

} // namespace

// ============================================================================
// SHA3-256 Tests
// ============================================================================

TEST(SHA3Test, EmptyInput) {
    Hash256 h = SHA3Hash(nullptr, 0);
    EXPECT_EQ(h.ToHex(), "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(SHA3Test, Abc) {
    auto data = Bytes("abc");
    Hash256 h = SHA3Hash(data.data(), data.size());
    EXPECT_EQ(h.ToHex(), "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(SHA3Test, IncrementalMatchesOneShot) {
    auto data = Bytes("abc");
    Hash256 expected = SHA3Hash(data.data(), data.size());
    
    Hash256 h;
    SHA3_256 hasher;
    hasher.Write(data.data(), 1).Write(data.data() + 1, 2).Finalize(h.data());
    EXPECT_EQ(h, expected);
    
    Hash256 again;
    hasher.Reset().Write(data.data(), data.size()).Finalize(again.data());
    EXPECT_EQ(again, expected);
}

// ============================================================================
// HashToField Tests
// ============================================================================

TEST(HashToFieldTest, DropsLowByteOfDigest) {
    EXPECT_EQ(HashToField(nullptr, 0).ToHex(),
              "0x00a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f843");
    EXPECT_EQ(HashToField(Bytes("abc")).ToHex(),
              "0x003a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe245114315");
}

TEST(HashToFieldTest, AlwaysBelowModulus) {
    for (int i = 0; i < 64; ++i) {
        auto data = Bytes("input-" + std::to_string(i));
        FieldElement fe = HashToField(data);
        EXPECT_LT(fe.ToUint256(), FieldElement::MODULUS);
        EXPECT_EQ(fe.ToBytes()[0], 0);
    }
}

// ============================================================================
// Signal and External Nullifier Tests
// ============================================================================

class DerivationTest : public ::testing::Test {
protected:
    Address receiver = Address::FromHex("0x0000000000000000000000000000000000000001");
    Address contract = Address::FromHex("0x1111111111111111111111111111111111111111");
};

TEST_F(DerivationTest, SignalIsHashOfReceiver) {
    EXPECT_EQ(ComputeSignal(receiver).ToHex(),
              "0x008860a6a1a232ed88449d3348941e9191273dbb554eebd042502cdffbad435a");
}

TEST_F(DerivationTest, SignalDiffersPerReceiver) {
    Address other = Address::FromHex("0x0000000000000000000000000000000000000002");
    EXPECT_NE(ComputeSignal(receiver), ComputeSignal(other));
}

TEST_F(DerivationTest, ExternalNullifierUsesContractAndWideId) {
    EXPECT_EQ(ComputeExternalNullifier(contract, 1).ToHex(),
              "0x0061faf793caf8d9adc60ba26102e99820e20d9521ef29f777fb82927814048a");
    EXPECT_EQ(ComputeExternalNullifier(contract, 2).ToHex(),
              "0x00e21c794a1ddeaacdc27a6c4a639529a3ddcb3433f89d59632ef90100d0dc21");
}

TEST_F(DerivationTest, ExternalNullifierScopedToDeployment) {
    Address otherContract = Address::FromHex("0x2222222222222222222222222222222222222222");
    EXPECT_NE(ComputeExternalNullifier(contract, 1),
              ComputeExternalNullifier(otherContract, 1));
}

TEST_F(DerivationTest, ExternalNullifierUniquePerAirdrop) {
    std::set<FieldElement> seen;
    for (AirdropId id = 1; id <= 32; ++id) {
        seen.insert(ComputeExternalNullifier(contract, id));
    }
    EXPECT_EQ(seen.size(), 32u);
}

} // namespace test
} // namespace zkdrop
