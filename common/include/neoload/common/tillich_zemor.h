/**
 * @file tillich_zemor.h
 * @brief Tillich-Zemor homomorphic hash over SL(2, GF(2^127))
 *
 * The hash of a concatenation equals the matrix product of the hashes of
 * its parts, so the store can check a payload assembled from pieces
 * without rehashing the original.
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_TILLICH_ZEMOR_H
#define NEOLOAD_TILLICH_ZEMOR_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace neoload {
namespace crypto {

constexpr size_t TZ_HASH_SIZE = 64;

class TillichZemor {
public:
    /**
     * @brief Hash a byte sequence (single-shot)
     * @return 64-byte digest; the empty input hashes to the identity matrix
     */
    static std::vector<uint8_t> Sum(const std::vector<uint8_t>& data);

    /**
     * @brief Combine digests of consecutive segments
     * @param hashes Digests in payload order
     * @return Digest of the concatenated segments
     * @throws CryptoError if a digest is malformed
     */
    static std::vector<uint8_t> Concat(const std::vector<std::vector<uint8_t>>& hashes);

    /**
     * @brief Check that hash is the digest of the concatenation of parts
     * @throws CryptoError if a digest is malformed
     */
    static bool Validate(
        const std::vector<uint8_t>& hash,
        const std::vector<std::vector<uint8_t>>& parts
    );

    /**
     * @brief Streaming hasher
     */
    class Hasher {
    public:
        Hasher();
        ~Hasher();

        Hasher(const Hasher&) = delete;
        Hasher& operator=(const Hasher&) = delete;
        Hasher(Hasher&&) noexcept;
        Hasher& operator=(Hasher&&) noexcept;

        void Update(const uint8_t* data, size_t size);

        void Update(const std::vector<uint8_t>& chunk) { Update(chunk.data(), chunk.size()); }

        /**
         * @throws CryptoError if already finalized
         */
        std::vector<uint8_t> Finalize();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
};

} // namespace crypto
} // namespace neoload

#endif // NEOLOAD_TILLICH_ZEMOR_H
