/**
 * @file bench_config.cpp
 * @brief Benchmark configuration parsing
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/client/bench_config.h"
#include "neoload/common/errors.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace neoload {

namespace {

template <typename T>
void ReadField(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid value of \"") + key + "\": " + e.what());
    }
}

// Sizes are rejected when negative instead of wrapping around
void ReadSize(const json& j, const char* key, uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw ConfigurationError(std::string("\"") + key + "\" must be an integer");
    }
    if (!it->is_number_unsigned() && it->get<int64_t>() < 0) {
        throw ConfigurationError(std::string("\"") + key + "\" must not be negative");
    }
    out = it->get<uint64_t>();
}

BenchMode ParseMode(const std::string& mode) {
    if (mode == "put") {
        return BenchMode::Put;
    }
    if (mode == "get") {
        return BenchMode::Get;
    }
    if (mode == "prepared") {
        return BenchMode::Prepared;
    }
    throw ConfigurationError("unknown mode \"" + mode + "\" (expected put, get or prepared)");
}

} // anonymous namespace

const char* BenchModeName(BenchMode mode) {
    switch (mode) {
        case BenchMode::Put: return "put";
        case BenchMode::Get: return "get";
        case BenchMode::Prepared: return "prepared";
    }
    return "unknown";
}

BenchConfig ParseBenchConfig(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("invalid configuration JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigurationError("configuration must be a JSON object");
    }

    BenchConfig config;

    std::string mode = BenchModeName(config.mode);
    ReadField(j, "mode", mode);
    config.mode = ParseMode(mode);

    ReadField(j, "threads", config.threads);
    ReadField(j, "iterations", config.iterations);
    ReadSize(j, "payload_size", config.payload_size);
    ReadField(j, "buffer_size", config.buffer_size);
    ReadField(j, "container", config.container);
    ReadField(j, "key_file", config.key_file);
    ReadField(j, "attributes", config.attributes);
    ReadSize(j, "max_object_size", config.max_object_size);
    ReadField(j, "homomorphic_hashing_disabled", config.homomorphic_hashing_disabled);
    ReadSize(j, "epoch", config.epoch);
    ReadField(j, "timeout_ms", config.timeout_ms);

    if (config.threads <= 0) {
        throw ConfigurationError("\"threads\" must be positive");
    }
    if (config.iterations <= 0) {
        throw ConfigurationError("\"iterations\" must be positive");
    }
    if (config.buffer_size < 0) {
        throw ConfigurationError("\"buffer_size\" must not be negative");
    }
    if (config.timeout_ms < 0) {
        throw ConfigurationError("\"timeout_ms\" must not be negative");
    }
    return config;
}

BenchConfig LoadBenchConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("failed to open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseBenchConfig(buffer.str());
}

} // namespace neoload
