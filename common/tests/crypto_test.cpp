/**
 * @file crypto_test.cpp
 * @brief Unit tests for cryptographic primitives
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include "neoload/common/crypto.h"
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

using namespace neoload::crypto;

namespace {

std::string Hex(const std::vector<uint8_t>& data) {
    std::ostringstream ss;
    for (uint8_t b : data) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

std::vector<uint8_t> Bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // anonymous namespace

// ============================================================================
// Key Tests
// ============================================================================

TEST(CryptoTest, GeneratePrivateKey) {
    auto key = PrivateKey::Generate();
    EXPECT_TRUE(key.IsValid());

    // Verify PEM export
    std::string pem = key.ToPEM();
    EXPECT_FALSE(pem.empty());
    EXPECT_NE(pem.find("BEGIN"), std::string::npos);
}

TEST(CryptoTest, LoadPrivateKeyFromPEM) {
    auto key = PrivateKey::Generate();
    auto loaded = PrivateKey::LoadFromPEM(key.ToPEM());

    // Same key material derives the same public key
    EXPECT_EQ(PublicKey::FromPrivateKey(loaded).ToCompressed(),
              PublicKey::FromPrivateKey(key).ToCompressed());
}

TEST(CryptoTest, LoadPrivateKeyFromInvalidPEM) {
    EXPECT_THROW(PrivateKey::LoadFromPEM("not a key"), CryptoError);
}

TEST(CryptoTest, CompressedPublicKey) {
    auto key = PrivateKey::Generate();
    auto compressed = PublicKey::FromPrivateKey(key).ToCompressed();

    ASSERT_EQ(compressed.size(), P256_COMPRESSED_KEY_SIZE);
    EXPECT_TRUE(compressed[0] == 0x02 || compressed[0] == 0x03);

    // Decoding the point yields the same key
    EXPECT_EQ(PublicKey::FromBytes(compressed).ToCompressed(), compressed);
}

TEST(CryptoTest, PublicKeyFromInvalidBytes) {
    EXPECT_THROW(PublicKey::FromBytes({0x02, 0x01}), CryptoError);

    std::vector<uint8_t> bad(P256_COMPRESSED_KEY_SIZE, 0xFF);
    bad[0] = 0x02;
    EXPECT_THROW(PublicKey::FromBytes(bad), CryptoError);
}

TEST(CryptoTest, PublicKeyPEMRoundTrip) {
    auto pubkey = PublicKey::FromPrivateKey(PrivateKey::Generate());
    auto loaded = PublicKey::LoadFromPEM(pubkey.ToPEM());
    EXPECT_EQ(loaded.ToCompressed(), pubkey.ToCompressed());
}

// ============================================================================
// ECDSA Signature Tests
// ============================================================================

TEST(CryptoTest, ECDSASignVerify) {
    auto privkey = PrivateKey::Generate();
    auto pubkey = PublicKey::FromPrivateKey(privkey);

    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};

    auto signature = ECDSA::Sign(privkey, data);
    ASSERT_EQ(signature.size(), ECDSA_SIGNATURE_SIZE);
    EXPECT_EQ(signature[0], 0x04);

    EXPECT_TRUE(ECDSA::Verify(pubkey, data, signature));
}

TEST(CryptoTest, ECDSAVerifyFailsOnWrongData) {
    auto privkey = PrivateKey::Generate();
    auto pubkey = PublicKey::FromPrivateKey(privkey);

    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};
    std::vector<uint8_t> wrong_data = {0x01, 0x02, 0x03, 0x04, 0x06};

    auto signature = ECDSA::Sign(privkey, data);

    // Should throw SignatureVerificationError
    EXPECT_THROW(ECDSA::Verify(pubkey, wrong_data, signature), SignatureVerificationError);
}

TEST(CryptoTest, ECDSAVerifyFailsOnWrongKey) {
    auto privkey = PrivateKey::Generate();
    auto other = PublicKey::FromPrivateKey(PrivateKey::Generate());

    std::vector<uint8_t> data = {0xAA, 0xBB};
    auto signature = ECDSA::Sign(privkey, data);

    EXPECT_THROW(ECDSA::Verify(other, data, signature), SignatureVerificationError);
}

TEST(CryptoTest, ECDSAVerifyRejectsMalformedSignature) {
    auto pubkey = PublicKey::FromPrivateKey(PrivateKey::Generate());
    std::vector<uint8_t> data = {0x01};

    EXPECT_THROW(ECDSA::Verify(pubkey, data, std::vector<uint8_t>(64, 0x01)), CryptoError);
}

// ============================================================================
// Hash Tests
// ============================================================================

TEST(CryptoTest, SHA256KnownAnswer) {
    EXPECT_EQ(Hex(SHA256::Hash(Bytes("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(Hex(SHA256::Hash({})),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(CryptoTest, SHA512KnownAnswer) {
    EXPECT_EQ(Hex(SHA512::Hash(Bytes("abc"))),
              "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST(CryptoTest, RIPEMD160KnownAnswer) {
    EXPECT_EQ(Hex(RIPEMD160::Hash({})), "9c1185a5c5e9fc54612808977ee8f548b2258d31");
    EXPECT_EQ(Hex(RIPEMD160::Hash(Bytes("abc"))), "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc");
}

TEST(CryptoTest, RandomBytes) {
    auto a = RandomBytes(32);
    auto b = RandomBytes(32);
    EXPECT_EQ(a.size(), 32u);
    EXPECT_NE(a, b);
    EXPECT_TRUE(RandomBytes(0).empty());
}
