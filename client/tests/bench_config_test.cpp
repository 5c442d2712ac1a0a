/**
 * @file bench_config_test.cpp
 * @brief Unit tests for benchmark configuration parsing
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include "neoload/client/bench_config.h"
#include "neoload/common/errors.h"
#include <cstdio>
#include <fstream>
#include <string>

using namespace neoload;

TEST(BenchConfigTest, Defaults) {
    auto config = ParseBenchConfig("{}");

    EXPECT_EQ(config.mode, BenchMode::Put);
    EXPECT_EQ(config.threads, 1);
    EXPECT_EQ(config.buffer_size, 0);
    EXPECT_TRUE(config.container.empty());
    EXPECT_TRUE(config.attributes.empty());
    EXPECT_FALSE(config.homomorphic_hashing_disabled);
    EXPECT_EQ(config.timeout_ms, 0);
}

TEST(BenchConfigTest, AllKeys) {
    auto config = ParseBenchConfig(R"({
        "mode": "prepared",
        "threads": 8,
        "iterations": 50,
        "payload_size": 131072,
        "buffer_size": 4096,
        "container": "8Yvz7Ym3BsTN5GBV1HKuSRZ7vURJ6ebyWMWhAmZVm7Rq",
        "key_file": "/etc/neoload/wallet.pem",
        "attributes": {"Scenario": "soak", "Owner": "qa"},
        "max_object_size": 1048576,
        "homomorphic_hashing_disabled": true,
        "epoch": 12,
        "timeout_ms": 2500,
        "comment": "ignored"
    })");

    EXPECT_EQ(config.mode, BenchMode::Prepared);
    EXPECT_EQ(config.threads, 8);
    EXPECT_EQ(config.iterations, 50);
    EXPECT_EQ(config.payload_size, 131072u);
    EXPECT_EQ(config.buffer_size, 4096);
    EXPECT_EQ(config.container, "8Yvz7Ym3BsTN5GBV1HKuSRZ7vURJ6ebyWMWhAmZVm7Rq");
    EXPECT_EQ(config.key_file, "/etc/neoload/wallet.pem");
    EXPECT_EQ(config.attributes.size(), 2u);
    EXPECT_EQ(config.attributes.at("Scenario"), "soak");
    EXPECT_EQ(config.max_object_size, 1048576u);
    EXPECT_TRUE(config.homomorphic_hashing_disabled);
    EXPECT_EQ(config.epoch, 12u);
    EXPECT_EQ(config.timeout_ms, 2500);
}

TEST(BenchConfigTest, Modes) {
    EXPECT_EQ(ParseBenchConfig(R"({"mode": "get"})").mode, BenchMode::Get);
    EXPECT_EQ(ParseBenchConfig(R"({"mode": "put"})").mode, BenchMode::Put);
    EXPECT_THROW(ParseBenchConfig(R"({"mode": "delete"})"), ConfigurationError);
    EXPECT_STREQ(BenchModeName(BenchMode::Prepared), "prepared");
}

TEST(BenchConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(ParseBenchConfig("not json"), ConfigurationError);
    EXPECT_THROW(ParseBenchConfig("[1, 2]"), ConfigurationError);
    EXPECT_THROW(ParseBenchConfig(R"({"threads": "four"})"), ConfigurationError);
    EXPECT_THROW(ParseBenchConfig(R"({"threads": 0})"), ConfigurationError);
    EXPECT_THROW(ParseBenchConfig(R"({"iterations": -3})"), ConfigurationError);
    EXPECT_THROW(ParseBenchConfig(R"({"payload_size": -1})"), ConfigurationError);
    EXPECT_THROW(ParseBenchConfig(R"({"payload_size": "1k"})"), ConfigurationError);
    EXPECT_THROW(ParseBenchConfig(R"({"buffer_size": -1})"), ConfigurationError);
    EXPECT_THROW(ParseBenchConfig(R"({"attributes": {"k": 1}})"), ConfigurationError);
    EXPECT_THROW(ParseBenchConfig(R"({"homomorphic_hashing_disabled": "yes"})"), ConfigurationError);
}

TEST(BenchConfigTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "neoload_bench_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"mode": "get", "threads": 2})";
    }

    auto config = LoadBenchConfig(path);
    EXPECT_EQ(config.mode, BenchMode::Get);
    EXPECT_EQ(config.threads, 2);

    std::remove(path.c_str());
}

TEST(BenchConfigTest, LoadMissingFile) {
    EXPECT_THROW(LoadBenchConfig("/nonexistent/neoload.json"), ConfigurationError);
}
