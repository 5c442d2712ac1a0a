/**
 * @file checksum_test.cpp
 * @brief Unit tests for payload checksums
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include "neoload/common/checksum.h"
#include "neoload/common/crypto.h"
#include "neoload/common/tillich_zemor.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

using namespace neoload;

namespace {

std::string Hex(const std::vector<uint8_t>& data) {
    std::ostringstream ss;
    for (uint8_t b : data) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

} // namespace

TEST(ChecksumTest, ComputeWithHomomorphic) {
    std::vector<uint8_t> payload = {1, 2, 3, 4, 5, 6, 7, 8};
    auto sums = ComputeChecksums(payload, true);

    EXPECT_EQ(sums.payload.type, ChecksumType::SHA256);
    EXPECT_EQ(sums.payload.sum, crypto::SHA256::Hash(payload));

    ASSERT_TRUE(sums.homomorphic.has_value());
    EXPECT_EQ(sums.homomorphic->type, ChecksumType::TillichZemor);
    EXPECT_EQ(sums.homomorphic->sum, crypto::TillichZemor::Sum(payload));
}

TEST(ChecksumTest, ComputeWithoutHomomorphic) {
    auto sums = ComputeChecksums({1, 2, 3}, false);
    EXPECT_FALSE(sums.homomorphic.has_value());
}

TEST(ChecksumTest, Deterministic) {
    auto payload = crypto::RandomBytes(5000);
    auto a = ComputeChecksums(payload, true);
    auto b = ComputeChecksums(payload, true);

    EXPECT_EQ(a.payload, b.payload);
    EXPECT_EQ(*a.homomorphic, *b.homomorphic);
}

TEST(ChecksumTest, EmptyPayload) {
    auto sums = ComputeChecksums({}, true);
    EXPECT_EQ(sums.payload.sum, crypto::SHA256::Hash({}));
    EXPECT_EQ(sums.homomorphic->sum, crypto::TillichZemor::Sum({}));
}

TEST(ChecksumTest, Verify) {
    std::vector<uint8_t> payload = {9, 8, 7};
    auto sums = ComputeChecksums(payload, true);

    EXPECT_TRUE(VerifyChecksum(sums.payload, payload));
    EXPECT_TRUE(VerifyChecksum(*sums.homomorphic, payload));
    EXPECT_FALSE(VerifyChecksum(sums.payload, {9, 8, 6}));
    EXPECT_FALSE(VerifyChecksum(Checksum{}, payload));
}

TEST(ChecksumTest, CalculatorMatchesSingleShot) {
    auto payload = crypto::RandomBytes(3 * 1024 + 17);

    ChecksumCalculator calc(true);
    for (size_t off = 0; off < payload.size(); off += 1024) {
        calc.Update(payload.data() + off, std::min<size_t>(1024, payload.size() - off));
    }
    auto streamed = calc.Finalize();
    auto direct = ComputeChecksums(payload, true);

    EXPECT_EQ(streamed.payload, direct.payload);
    EXPECT_EQ(streamed.homomorphic, direct.homomorphic);
}

TEST(ChecksumTest, CalculatorCountsBytes) {
    std::vector<uint8_t> data(1000);
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = static_cast<uint8_t>(i * 7);
    }

    ChecksumCalculator calc(false);
    EXPECT_EQ(calc.Size(), 0u);
    calc.Update(data.data(), 333);
    calc.Update(data.data() + 333, 0);
    EXPECT_EQ(calc.Size(), 333u);
    calc.Update(data.data() + 333, data.size() - 333);
    EXPECT_EQ(calc.Size(), data.size());

    auto sums = calc.Finalize();
    EXPECT_EQ(sums.payload.sum, crypto::SHA256::Hash(data));
    EXPECT_FALSE(sums.homomorphic.has_value());
}

TEST(ChecksumTest, CalculatorFinalizeTwice) {
    ChecksumCalculator calc(true);
    const uint8_t abc[] = {'a', 'b', 'c'};
    calc.Update(abc, sizeof(abc));
    calc.Finalize();
    EXPECT_THROW(calc.Finalize(), crypto::CryptoError);
    EXPECT_THROW(calc.Update(abc, sizeof(abc)), crypto::CryptoError);
}

TEST(ChecksumTest, CalculatorKnownAnswer) {
    const std::string text = "hello neofs";
    ChecksumCalculator calc(true);
    calc.Update(reinterpret_cast<const uint8_t*>(text.data()), 5);
    calc.Update(reinterpret_cast<const uint8_t*>(text.data()) + 5, text.size() - 5);
    auto sums = calc.Finalize();

    EXPECT_EQ(Hex(sums.payload.sum),
              "f84777054123aceac11cfa51fd7642a7c5ecd82e77d1d8c9a4dd09b53df9f92a");
    ASSERT_TRUE(sums.homomorphic.has_value());
    EXPECT_EQ(Hex(sums.homomorphic->sum),
              "0000000001c81bf31212ec2b7c14036f000000000142296215ec2c06e3be645d"
              "0000000000da368413ebd4789bbe622300000000008c4af70606b82a7854072a");
}
