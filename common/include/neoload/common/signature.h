/**
 * @file signature.h
 * @brief Signature records attached to objects and session tokens
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_SIGNATURE_H
#define NEOLOAD_SIGNATURE_H

#include <cstdint>
#include <vector>

namespace neoload {

namespace crypto {
class PrivateKey;
}

/**
 * @brief Signature scheme, numbered as on the wire
 */
enum class SignatureScheme {
    ECDSA_SHA512 = 0,
    ECDSA_RFC6979_SHA256 = 1,
    ECDSA_RFC6979_SHA256_WALLET_CONNECT = 2
};

struct Signature {
    std::vector<uint8_t> key;    ///< 33-byte compressed public key
    std::vector<uint8_t> sign;   ///< 65-byte ECDSA signature
    SignatureScheme scheme = SignatureScheme::ECDSA_SHA512;

    bool operator==(const Signature& other) const {
        return key == other.key && sign == other.sign && scheme == other.scheme;
    }
};

/**
 * @brief Sign data with ECDSA_SHA512
 * @throws crypto::CryptoError on invalid key material
 */
Signature SignData(const crypto::PrivateKey& key, const std::vector<uint8_t>& data);

/**
 * @brief Check signature against data
 * @return false if the signature does not match, the key does not decode
 *         or the scheme is not ECDSA_SHA512
 */
bool VerifyData(const Signature& signature, const std::vector<uint8_t>& data);

} // namespace neoload

#endif // NEOLOAD_SIGNATURE_H
