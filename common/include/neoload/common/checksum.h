/**
 * @file checksum.h
 * @brief Payload checksums: SHA-256 and optional Tillich-Zemor
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_CHECKSUM_H
#define NEOLOAD_CHECKSUM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace neoload {

/**
 * @brief Checksum algorithm, numbered as on the wire
 */
enum class ChecksumType {
    Unspecified = 0,
    TillichZemor = 1,
    SHA256 = 2
};

struct Checksum {
    ChecksumType type = ChecksumType::Unspecified;
    std::vector<uint8_t> sum;

    bool operator==(const Checksum& other) const { return type == other.type && sum == other.sum; }
    bool operator!=(const Checksum& other) const { return !(*this == other); }
};

/**
 * @brief Checksums written into an object header
 */
struct PayloadChecksums {
    Checksum payload;                     ///< SHA-256 of the payload
    std::optional<Checksum> homomorphic;  ///< Tillich-Zemor, absent when disabled network-wide
};

/**
 * @brief Compute payload checksums (single-shot)
 *
 * The empty payload is valid and yields the digests of the empty sequence.
 *
 * @param payload Payload bytes
 * @param homomorphic Also compute the Tillich-Zemor digest
 */
PayloadChecksums ComputeChecksums(const std::vector<uint8_t>& payload, bool homomorphic);

/**
 * @brief Recompute a checksum over payload and compare
 * @return false on mismatch or unsupported type
 */
bool VerifyChecksum(const Checksum& checksum, const std::vector<uint8_t>& payload);

/**
 * @brief Incremental checksum computation for chunked payloads
 *
 * Also counts the bytes fed so far, letting a receiver compare the
 * streamed length with the declared payload size.
 */
class ChecksumCalculator {
public:
    explicit ChecksumCalculator(bool homomorphic);
    ~ChecksumCalculator();

    ChecksumCalculator(const ChecksumCalculator&) = delete;
    ChecksumCalculator& operator=(const ChecksumCalculator&) = delete;

    /**
     * @throws crypto::CryptoError after Finalize()
     */
    void Update(const uint8_t* data, size_t size);

    /**
     * @return Number of payload bytes passed to Update()
     */
    uint64_t Size() const;

    /**
     * @throws crypto::CryptoError if called twice
     */
    PayloadChecksums Finalize();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace neoload

#endif // NEOLOAD_CHECKSUM_H
