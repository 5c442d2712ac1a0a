/**
 * @file crypto_keys.cpp
 * @brief ECDSA P-256 key wrapper implementations (OpenSSL 3.x)
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cstdio>

namespace neoload {
namespace crypto {

using namespace internal;

namespace {

constexpr const char* P256_GROUP_NAME = "prime256v1";

// OpenSSL reports the group either by short name or by NIST name
bool IsP256(EVP_PKEY* pkey) {
    if (!pkey || !EVP_PKEY_is_a(pkey, "EC")) {
        return false;
    }

    char name[64] = {0};
    size_t name_len = 0;
    if (EVP_PKEY_get_group_name(pkey, name, sizeof(name), &name_len) != 1) {
        return false;
    }

    int nid = OBJ_sn2nid(name);
    if (nid == NID_undef) {
        nid = EC_curve_nist2nid(name);
    }
    return nid == NID_X9_62_prime256v1;
}

} // anonymous namespace

// ============================================================================
// PrivateKey Implementation
// ============================================================================

class PrivateKey::Impl {
public:
    EVP_PKEY* pkey = nullptr;

    ~Impl() {
        if (pkey) {
            EVP_PKEY_free(pkey);
        }
    }
};

PrivateKey::PrivateKey() : impl_(std::make_unique<Impl>()) {}

PrivateKey::~PrivateKey() = default;

PrivateKey::PrivateKey(PrivateKey&&) noexcept = default;
PrivateKey& PrivateKey::operator=(PrivateKey&&) noexcept = default;

PrivateKey PrivateKey::LoadFromFile(const std::string& path) {
    FILE* fp = fopen(path.c_str(), "r");
    if (!fp) {
        throw CryptoError("Failed to open private key file: " + path);
    }

    PrivateKey key;
    key.impl_->pkey = PEM_read_PrivateKey(fp, nullptr, nullptr, nullptr);
    fclose(fp);

    if (!key.impl_->pkey) {
        throw CryptoError("Failed to parse private key from: " + path);
    }
    if (!IsP256(key.impl_->pkey)) {
        throw CryptoError("Private key is not a P-256 key: " + path);
    }

    return key;
}

PrivateKey PrivateKey::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM");
    }

    PrivateKey key;
    key.impl_->pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);

    if (!key.impl_->pkey) {
        throw CryptoError("Failed to parse private key from PEM");
    }
    if (!IsP256(key.impl_->pkey)) {
        throw CryptoError("Private key is not a P-256 key");
    }

    return key;
}

PrivateKey PrivateKey::Generate() {
    // SECURITY: Verify PRNG is properly seeded before generating keys
    if (RAND_status() != 1) {
        throw CryptoError("OpenSSL PRNG not properly seeded - insufficient entropy");
    }

    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!ctx) {
        throw CryptoError("Failed to create EC context");
    }

    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw CryptoError("Failed to initialize EC keygen");
    }

    if (EVP_PKEY_CTX_set_group_name(ctx.get(), P256_GROUP_NAME) <= 0) {
        throw CryptoError("Failed to select P-256 group");
    }

    PrivateKey key;
    if (EVP_PKEY_keygen(ctx.get(), &key.impl_->pkey) <= 0) {
        throw CryptoError("Failed to generate P-256 key pair");
    }

    return key;
}

std::string PrivateKey::ToPEM() const {
    if (!impl_->pkey) {
        throw CryptoError("Private key is empty");
    }

    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PrivateKey(bio.get(), impl_->pkey, nullptr, nullptr, 0, nullptr, nullptr)) {
        throw CryptoError("Failed to write private key to PEM");
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, len);
}

bool PrivateKey::IsValid() const {
    return impl_ && impl_->pkey != nullptr;
}

void* PrivateKey::GetNativeHandle() const {
    return impl_->pkey;
}

// ============================================================================
// PublicKey Implementation
// ============================================================================

class PublicKey::Impl {
public:
    EVP_PKEY* pkey = nullptr;

    ~Impl() {
        if (pkey) {
            EVP_PKEY_free(pkey);
        }
    }
};

PublicKey::PublicKey() : impl_(std::make_unique<Impl>()) {}

PublicKey::~PublicKey() = default;

PublicKey::PublicKey(PublicKey&&) noexcept = default;
PublicKey& PublicKey::operator=(PublicKey&&) noexcept = default;

PublicKey PublicKey::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM");
    }

    PublicKey key;
    key.impl_->pkey = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);

    if (!key.impl_->pkey) {
        throw CryptoError("Failed to parse public key from PEM");
    }
    if (!IsP256(key.impl_->pkey)) {
        throw CryptoError("Public key is not a P-256 key");
    }

    return key;
}

PublicKey PublicKey::FromPrivateKey(const PrivateKey& privkey) {
    EVP_PKEY* priv_pkey = static_cast<EVP_PKEY*>(privkey.GetNativeHandle());
    if (!priv_pkey) {
        throw CryptoError("Private key is empty");
    }

    // Export and re-import public half via BIO
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO for public key");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), priv_pkey)) {
        throw CryptoError("Failed to write public key");
    }

    PublicKey key;
    key.impl_->pkey = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (!key.impl_->pkey) {
        throw CryptoError("Failed to read back public key");
    }

    return key;
}

PublicKey PublicKey::FromBytes(const std::vector<uint8_t>& encoded) {
    bool compressed = encoded.size() == P256_COMPRESSED_KEY_SIZE &&
                      (encoded[0] == 0x02 || encoded[0] == 0x03);
    bool uncompressed = encoded.size() == P256_UNCOMPRESSED_KEY_SIZE && encoded[0] == 0x04;
    if (!compressed && !uncompressed) {
        throw CryptoError("Invalid P-256 public key encoding");
    }

    OSSL_PARAM_BLD_ptr bld(OSSL_PARAM_BLD_new());
    if (!bld) {
        throw CryptoError("Failed to create parameter builder");
    }

    if (OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, P256_GROUP_NAME, 0) != 1 ||
        OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY, encoded.data(), encoded.size()) != 1) {
        throw CryptoError("Failed to build public key parameters");
    }

    OSSL_PARAM_ptr params(OSSL_PARAM_BLD_to_param(bld.get()));
    if (!params) {
        throw CryptoError("Failed to convert public key parameters");
    }

    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
    if (!ctx) {
        throw CryptoError("Failed to create EC context");
    }

    if (EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
        throw CryptoError("Failed to initialize public key import");
    }

    PublicKey key;
    if (EVP_PKEY_fromdata(ctx.get(), &key.impl_->pkey, EVP_PKEY_PUBLIC_KEY, params.get()) <= 0) {
        throw CryptoError("Public key is not a point on P-256");
    }

    return key;
}

std::vector<uint8_t> PublicKey::ToCompressed() const {
    if (!impl_->pkey) {
        throw CryptoError("Public key is empty");
    }

    std::vector<uint8_t> point(P256_UNCOMPRESSED_KEY_SIZE);
    size_t point_len = 0;
    if (EVP_PKEY_get_octet_string_param(impl_->pkey, OSSL_PKEY_PARAM_PUB_KEY,
                                        point.data(), point.size(), &point_len) != 1) {
        throw CryptoError("Failed to export public key point");
    }

    if (point_len == P256_COMPRESSED_KEY_SIZE) {
        point.resize(point_len);
        return point;
    }
    if (point_len != P256_UNCOMPRESSED_KEY_SIZE || point[0] != 0x04) {
        throw CryptoError("Unexpected public key point encoding");
    }

    // 0x02 for even Y, 0x03 for odd Y
    std::vector<uint8_t> compressed(P256_COMPRESSED_KEY_SIZE);
    compressed[0] = (point[P256_UNCOMPRESSED_KEY_SIZE - 1] & 1) ? 0x03 : 0x02;
    std::copy(point.begin() + 1, point.begin() + 1 + P256_SCALAR_SIZE, compressed.begin() + 1);
    return compressed;
}

std::string PublicKey::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), impl_->pkey)) {
        throw CryptoError("Failed to write public key to PEM");
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, len);
}

void* PublicKey::GetNativeHandle() const {
    return impl_->pkey;
}

// ============================================================================
// Randomness
// ============================================================================

std::vector<uint8_t> RandomBytes(size_t size) {
    if (RAND_status() != 1) {
        throw CryptoError("OpenSSL PRNG not properly seeded - insufficient entropy");
    }

    std::vector<uint8_t> out(size);
    if (size > 0 && RAND_bytes(out.data(), static_cast<int>(size)) != 1) {
        throw CryptoError("Failed to generate random bytes");
    }
    return out;
}

} // namespace crypto
} // namespace neoload
