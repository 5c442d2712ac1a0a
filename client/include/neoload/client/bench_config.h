/**
 * @file bench_config.h
 * @brief JSON workload configuration of the benchmark tool
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_BENCH_CONFIG_H
#define NEOLOAD_BENCH_CONFIG_H

#include <cstdint>
#include <map>
#include <string>

namespace neoload {

enum class BenchMode {
    Put,        ///< Session-delegated PUT of a fresh object per iteration
    Get,        ///< GET of objects uploaded during setup
    Prepared    ///< One prepare, then PreparedObject::Put per iteration
};

const char* BenchModeName(BenchMode mode);

struct BenchConfig {
    BenchMode mode = BenchMode::Put;
    int threads = 1;
    int iterations = 100;                 ///< Per thread
    uint64_t payload_size = 4096;
    int64_t buffer_size = 0;              ///< 0 selects the default chunk size
    std::string container;                ///< Base58; random when empty
    std::string key_file;                 ///< PEM; generated when empty
    std::map<std::string, std::string> attributes;
    uint64_t max_object_size = 64 * 1024 * 1024;
    bool homomorphic_hashing_disabled = false;
    uint64_t epoch = 1;
    int64_t timeout_ms = 0;               ///< Per operation; 0 = none
};

/**
 * @brief Parse configuration from JSON text
 *
 * Absent keys keep their defaults; unknown keys are ignored.
 *
 * @throws ConfigurationError on invalid JSON, wrong value types, unknown
 *         mode, or non-positive thread/iteration counts
 */
BenchConfig ParseBenchConfig(const std::string& json_text);

/**
 * @brief Read and parse a configuration file
 * @throws ConfigurationError if the file cannot be read or parsed
 */
BenchConfig LoadBenchConfig(const std::string& path);

} // namespace neoload

#endif // NEOLOAD_BENCH_CONFIG_H
