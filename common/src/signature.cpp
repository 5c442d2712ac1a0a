/**
 * @file signature.cpp
 * @brief ECDSA_SHA512 signature records
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/common/signature.h"
#include "neoload/common/crypto.h"
#include <glog/logging.h>

namespace neoload {

Signature SignData(const crypto::PrivateKey& key, const std::vector<uint8_t>& data) {
    Signature signature;
    signature.key = crypto::PublicKey::FromPrivateKey(key).ToCompressed();
    signature.sign = crypto::ECDSA::Sign(key, data);
    signature.scheme = SignatureScheme::ECDSA_SHA512;
    return signature;
}

bool VerifyData(const Signature& signature, const std::vector<uint8_t>& data) {
    if (signature.scheme != SignatureScheme::ECDSA_SHA512) {
        return false;
    }

    try {
        auto key = crypto::PublicKey::FromBytes(signature.key);
        return crypto::ECDSA::Verify(key, data, signature.sign);
    } catch (const crypto::CryptoError& e) {
        VLOG(1) << "Signature rejected: " << e.what();
        return false;
    }
}

} // namespace neoload
