/*
 * ============================================================================
 * PromptShield Hash Utilities Unit Tests
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include <gtest/gtest.h>
#include "../../../src/Utils/HashUtils.hpp"
#include <string>
#include <vector>

using namespace PromptShield::Utils::HashUtils;

// ============================================================================
// Test Fixture
// ============================================================================

class HashUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
    }

    void TearDown() override {
    }

    std::string HashHex(Algorithm alg, const std::string& data) {
        Hasher h(alg);
        std::string hex;
        EXPECT_TRUE(h.Init());
        EXPECT_TRUE(h.Update(data.data(), data.size()));
        EXPECT_TRUE(h.FinalHex(hex));
        return hex;
    }
};

// ============================================================================
// Known Answer Tests
// ============================================================================

TEST_F(HashUtilsTest, Sha256_Abc) {
    EXPECT_EQ(HashHex(Algorithm::SHA256, "abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashUtilsTest, Sha384_Abc) {
    EXPECT_EQ(HashHex(Algorithm::SHA384, "abc"),
              "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed"
              "8086072ba1e7cc2358baeca134c825a7");
}

TEST_F(HashUtilsTest, Sha512_Abc) {
    EXPECT_EQ(HashHex(Algorithm::SHA512, "abc"),
              "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST_F(HashUtilsTest, Sha256Hex_EmptyInput) {
    const auto hex = Sha256Hex("");
    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(*hex, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HashUtilsTest, Sha256Hex_MatchesStreaming) {
    Hasher h(Algorithm::SHA256);
    ASSERT_TRUE(h.Init());
    ASSERT_TRUE(h.Update("hello ", 6));
    ASSERT_TRUE(h.Update("world", 5));
    std::string streamed;
    ASSERT_TRUE(h.FinalHex(streamed));

    const auto oneShot = Sha256Hex("hello world");
    ASSERT_TRUE(oneShot.has_value());
    EXPECT_EQ(streamed, *oneShot);
    EXPECT_EQ(*oneShot, "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

// ============================================================================
// Hasher State Tests
// ============================================================================

TEST_F(HashUtilsTest, Hasher_DigestSizes) {
    EXPECT_EQ(DigestSize(Algorithm::SHA256), 32u);
    EXPECT_EQ(DigestSize(Algorithm::SHA384), 48u);
    EXPECT_EQ(DigestSize(Algorithm::SHA512), 64u);
    EXPECT_EQ(Hasher(Algorithm::SHA384).GetDigestSize(), 48u);
}

TEST_F(HashUtilsTest, Hasher_UpdateBeforeInitFails) {
    Hasher h;
    Error err;
    EXPECT_FALSE(h.Update("x", 1, &err));
    EXPECT_TRUE(err.hasError());
    EXPECT_FALSE(err.message.empty());
}

TEST_F(HashUtilsTest, Hasher_FinalResetsState) {
    Hasher h;
    ASSERT_TRUE(h.Init());
    EXPECT_TRUE(h.IsInitialized());

    std::vector<uint8_t> digest;
    ASSERT_TRUE(h.Final(digest));
    EXPECT_EQ(digest.size(), 32u);
    EXPECT_FALSE(h.IsInitialized());

    EXPECT_FALSE(h.Final(digest));
    EXPECT_TRUE(digest.empty());
}

TEST_F(HashUtilsTest, Hasher_NullDataWithLength) {
    Hasher h;
    ASSERT_TRUE(h.Init());
    Error err;
    EXPECT_FALSE(h.Update(nullptr, 4, &err));
    EXPECT_TRUE(err.hasError());
}

TEST_F(HashUtilsTest, Hasher_MoveTransfersContext) {
    Hasher a;
    ASSERT_TRUE(a.Init());
    ASSERT_TRUE(a.Update("abc", 3));

    Hasher b(std::move(a));
    EXPECT_FALSE(a.IsInitialized());
    EXPECT_TRUE(b.IsInitialized());

    std::string hex;
    ASSERT_TRUE(b.FinalHex(hex));
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashUtilsTest, Error_Clear) {
    Error err;
    err.message = "x";
    err.opensslError = 7;
    err.clear();
    EXPECT_FALSE(err.hasError());
}

// ============================================================================
// Hex Encoding
// ============================================================================

TEST_F(HashUtilsTest, ToHexLower) {
    const std::vector<uint8_t> bytes = { 0x00, 0x0F, 0xA5, 0xFF };
    EXPECT_EQ(ToHexLower(bytes), "000fa5ff");
    EXPECT_EQ(ToHexLower(nullptr, 0), "");
}
