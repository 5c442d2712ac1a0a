/**
 * @file openssl_wrappers.h
 * @brief RAII wrappers for OpenSSL resources
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_OPENSSL_WRAPPERS_H
#define NEOLOAD_OPENSSL_WRAPPERS_H

#include <memory>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/param_build.h>

namespace neoload {
namespace crypto {
namespace internal {

// Custom deleters for OpenSSL types
struct EVP_PKEY_Deleter {
    void operator()(EVP_PKEY* p) const { if (p) EVP_PKEY_free(p); }
};

struct EVP_PKEY_CTX_Deleter {
    void operator()(EVP_PKEY_CTX* p) const { if (p) EVP_PKEY_CTX_free(p); }
};

struct BIO_Deleter {
    void operator()(BIO* p) const { if (p) BIO_free(p); }
};

struct OSSL_PARAM_Deleter {
    void operator()(OSSL_PARAM* p) const { if (p) OSSL_PARAM_free(p); }
};

struct OSSL_PARAM_BLD_Deleter {
    void operator()(OSSL_PARAM_BLD* p) const { if (p) OSSL_PARAM_BLD_free(p); }
};

struct EVP_MD_CTX_Deleter {
    void operator()(EVP_MD_CTX* p) const { if (p) EVP_MD_CTX_free(p); }
};

struct EVP_MD_Deleter {
    void operator()(EVP_MD* p) const { if (p) EVP_MD_free(p); }
};

struct ECDSA_SIG_Deleter {
    void operator()(ECDSA_SIG* p) const { if (p) ECDSA_SIG_free(p); }
};

struct BIGNUM_Deleter {
    void operator()(BIGNUM* p) const { if (p) BN_free(p); }
};

// RAII wrappers using unique_ptr
using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
using BIO_ptr = std::unique_ptr<BIO, BIO_Deleter>;
using OSSL_PARAM_ptr = std::unique_ptr<OSSL_PARAM, OSSL_PARAM_Deleter>;
using OSSL_PARAM_BLD_ptr = std::unique_ptr<OSSL_PARAM_BLD, OSSL_PARAM_BLD_Deleter>;
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
using EVP_MD_ptr = std::unique_ptr<EVP_MD, EVP_MD_Deleter>;
using ECDSA_SIG_ptr = std::unique_ptr<ECDSA_SIG, ECDSA_SIG_Deleter>;
using BIGNUM_ptr = std::unique_ptr<BIGNUM, BIGNUM_Deleter>;

} // namespace internal
} // namespace crypto
} // namespace neoload

#endif // NEOLOAD_OPENSSL_WRAPPERS_H
