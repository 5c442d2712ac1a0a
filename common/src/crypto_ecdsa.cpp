/**
 * @file crypto_ecdsa.cpp
 * @brief ECDSA-SHA512 signing/verification and one-shot digests
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace neoload {
namespace crypto {

using namespace internal;

// ============================================================================
// ECDSA Implementation
// ============================================================================

std::vector<uint8_t> ECDSA::Sign(
    const PrivateKey& private_key,
    const std::vector<uint8_t>& data
) {
    EVP_PKEY* pkey = static_cast<EVP_PKEY*>(private_key.GetNativeHandle());
    if (!pkey || !EVP_PKEY_is_a(pkey, "EC")) {
        throw CryptoError("Key is not an EC private key");
    }

    EVP_MD_CTX_ptr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw CryptoError("Failed to create signature context");
    }

    if (EVP_DigestSignInit(md_ctx.get(), nullptr, EVP_sha512(), nullptr, pkey) != 1) {
        throw CryptoError("Failed to initialize ECDSA signing");
    }

    // OpenSSL produces DER, the store expects 0x04 || r || s
    size_t der_len = 0;
    if (EVP_DigestSign(md_ctx.get(), nullptr, &der_len, data.data(), data.size()) != 1) {
        throw CryptoError("Failed to get ECDSA signature length");
    }

    std::vector<uint8_t> der(der_len);
    if (EVP_DigestSign(md_ctx.get(), der.data(), &der_len, data.data(), data.size()) != 1) {
        throw CryptoError("Failed to create ECDSA signature");
    }

    const unsigned char* p = der.data();
    ECDSA_SIG_ptr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der_len)));
    if (!sig) {
        throw CryptoError("Failed to decode ECDSA signature");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    std::vector<uint8_t> signature(ECDSA_SIGNATURE_SIZE);
    signature[0] = 0x04;
    if (BN_bn2binpad(r, signature.data() + 1, P256_SCALAR_SIZE) != static_cast<int>(P256_SCALAR_SIZE) ||
        BN_bn2binpad(s, signature.data() + 1 + P256_SCALAR_SIZE, P256_SCALAR_SIZE) != static_cast<int>(P256_SCALAR_SIZE)) {
        throw CryptoError("ECDSA signature scalar out of range");
    }

    return signature;
}

bool ECDSA::Verify(
    const PublicKey& public_key,
    const std::vector<uint8_t>& data,
    const std::vector<uint8_t>& signature
) {
    EVP_PKEY* pkey = static_cast<EVP_PKEY*>(public_key.GetNativeHandle());
    if (!pkey || !EVP_PKEY_is_a(pkey, "EC")) {
        throw CryptoError("Key is not an EC public key");
    }

    if (signature.size() != ECDSA_SIGNATURE_SIZE || signature[0] != 0x04) {
        throw CryptoError("Invalid ECDSA signature encoding (expected 65 bytes)");
    }

    BIGNUM_ptr r(BN_bin2bn(signature.data() + 1, P256_SCALAR_SIZE, nullptr));
    BIGNUM_ptr s(BN_bin2bn(signature.data() + 1 + P256_SCALAR_SIZE, P256_SCALAR_SIZE, nullptr));
    ECDSA_SIG_ptr sig(ECDSA_SIG_new());
    if (!r || !s || !sig) {
        throw CryptoError("Failed to allocate ECDSA signature");
    }

    // ECDSA_SIG_set0 takes ownership of r and s
    if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
        throw CryptoError("Failed to assemble ECDSA signature");
    }
    r.release();
    s.release();

    unsigned char* der = nullptr;
    int der_len = i2d_ECDSA_SIG(sig.get(), &der);
    if (der_len <= 0) {
        throw CryptoError("Failed to encode ECDSA signature");
    }
    std::vector<uint8_t> der_sig(der, der + der_len);
    OPENSSL_free(der);

    EVP_MD_CTX_ptr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw CryptoError("Failed to create verification context");
    }

    if (EVP_DigestVerifyInit(md_ctx.get(), nullptr, EVP_sha512(), nullptr, pkey) != 1) {
        throw CryptoError("Failed to initialize verification");
    }

    int result = EVP_DigestVerify(md_ctx.get(), der_sig.data(), der_sig.size(), data.data(), data.size());

    if (result == 1) {
        return true;
    } else if (result == 0) {
        throw SignatureVerificationError();
    } else {
        throw CryptoError("Signature verification error");
    }
}

// ============================================================================
// One-shot digests
// ============================================================================

std::vector<uint8_t> SHA256::Hash(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    ::SHA256(data.data(), data.size(), hash.data());
    return hash;
}

std::vector<uint8_t> SHA512::Hash(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> hash(SHA512_DIGEST_LENGTH);
    ::SHA512(data.data(), data.size(), hash.data());
    return hash;
}

std::vector<uint8_t> RIPEMD160::Hash(const std::vector<uint8_t>& data) {
    EVP_MD_ptr md(EVP_MD_fetch(nullptr, "RIPEMD160", nullptr));
    if (!md) {
        throw CryptoError("RIPEMD-160 is not available");
    }

    std::vector<uint8_t> hash(RIPEMD160_HASH_SIZE);
    unsigned int hash_len = 0;
    if (EVP_Digest(data.data(), data.size(), hash.data(), &hash_len, md.get(), nullptr) != 1 ||
        hash_len != RIPEMD160_HASH_SIZE) {
        throw CryptoError("Failed to compute RIPEMD-160");
    }
    return hash;
}

} // namespace crypto
} // namespace neoload
