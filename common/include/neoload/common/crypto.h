/**
 * @file crypto.h
 * @brief Cryptographic primitives for object identity and authorization
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_CRYPTO_H
#define NEOLOAD_CRYPTO_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace neoload {
namespace crypto {

/**
 * @brief Cryptographic exceptions
 */
class CryptoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SignatureVerificationError : public CryptoError {
public:
    SignatureVerificationError() : CryptoError("Signature verification failed") {}
};

/**
 * @brief Cryptographic size constants
 */
// ECDSA P-256 constants
constexpr size_t P256_SCALAR_SIZE = 32;             // Private scalar, r and s
constexpr size_t P256_COMPRESSED_KEY_SIZE = 33;     // 0x02/0x03 || X
constexpr size_t P256_UNCOMPRESSED_KEY_SIZE = 65;   // 0x04 || X || Y
constexpr size_t ECDSA_SIGNATURE_SIZE = 65;         // 0x04 || r || s

// Digest sizes
constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t SHA512_HASH_SIZE = 64;
constexpr size_t RIPEMD160_HASH_SIZE = 20;

/**
 * @brief ECDSA P-256 private key wrapper
 */
class PrivateKey {
public:
    PrivateKey();
    ~PrivateKey();

    PrivateKey(PrivateKey&&) noexcept;
    PrivateKey& operator=(PrivateKey&&) noexcept;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    /**
     * @brief Load private key from PEM file
     * @param path Path to PEM-encoded private key
     * @return Loaded private key
     * @throws CryptoError on parse error or if the key is not P-256
     */
    static PrivateKey LoadFromFile(const std::string& path);

    /**
     * @brief Load private key from PEM buffer
     * @param pem PEM-encoded private key
     * @return Loaded private key
     * @throws CryptoError on parse error or if the key is not P-256
     */
    static PrivateKey LoadFromPEM(const std::string& pem);

    /**
     * @brief Generate new P-256 key pair
     * @throws CryptoError on generation error
     */
    static PrivateKey Generate();

    /**
     * @brief Export to PEM format
     * @return PEM-encoded private key
     */
    std::string ToPEM() const;

    bool IsValid() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief ECDSA P-256 public key wrapper
 */
class PublicKey {
public:
    PublicKey();
    ~PublicKey();

    PublicKey(PublicKey&&) noexcept;
    PublicKey& operator=(PublicKey&&) noexcept;
    PublicKey(const PublicKey&) = delete;
    PublicKey& operator=(const PublicKey&) = delete;

    /**
     * @brief Load public key from PEM buffer
     * @throws CryptoError on parse error
     */
    static PublicKey LoadFromPEM(const std::string& pem);

    /**
     * @brief Derive public key from private key
     * @param privkey Private key
     * @return Corresponding public key
     */
    static PublicKey FromPrivateKey(const PrivateKey& privkey);

    /**
     * @brief Decode a SEC1 encoded point (compressed or uncompressed)
     * @param encoded 33 or 65 bytes
     * @throws CryptoError if the bytes are not a point on P-256
     */
    static PublicKey FromBytes(const std::vector<uint8_t>& encoded);

    /**
     * @brief Export as 33-byte compressed point
     */
    std::vector<uint8_t> ToCompressed() const;

    /**
     * @brief Export to PEM format
     */
    std::string ToPEM() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief ECDSA over SHA-512 (the store's default signature scheme)
 *
 * Signatures are 65 bytes: 0x04 || r || s, each scalar big-endian and
 * left-padded to 32 bytes.
 */
class ECDSA {
public:
    /**
     * @brief Sign data
     * @param private_key P-256 private key
     * @param data Data to sign (hashed with SHA-512 internally)
     * @return 65-byte signature
     * @throws CryptoError on signing failure
     */
    static std::vector<uint8_t> Sign(
        const PrivateKey& private_key,
        const std::vector<uint8_t>& data
    );

    /**
     * @brief Verify signature
     * @return true if signature is valid
     * @throws SignatureVerificationError if signature is invalid
     * @throws CryptoError on malformed input
     */
    static bool Verify(
        const PublicKey& public_key,
        const std::vector<uint8_t>& data,
        const std::vector<uint8_t>& signature
    );
};

/**
 * @brief SHA-256 hashing
 */
class SHA256 {
public:
    /**
     * @brief Compute SHA-256 hash (single-shot, convenience method)
     * @param data Data to hash
     * @return 32-byte hash
     */
    static std::vector<uint8_t> Hash(const std::vector<uint8_t>& data);
};

/**
 * @brief SHA-512 hashing (single-shot)
 */
class SHA512 {
public:
    static std::vector<uint8_t> Hash(const std::vector<uint8_t>& data);
};

/**
 * @brief RIPEMD-160 hashing (single-shot)
 * @throws CryptoError if the digest is not available in the loaded providers
 */
class RIPEMD160 {
public:
    static std::vector<uint8_t> Hash(const std::vector<uint8_t>& data);
};

/**
 * @brief Fill a buffer from the OpenSSL CSPRNG
 * @throws CryptoError if the PRNG is not seeded
 */
std::vector<uint8_t> RandomBytes(size_t size);

} // namespace crypto
} // namespace neoload

#endif // NEOLOAD_CRYPTO_H
