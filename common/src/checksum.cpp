/**
 * @file checksum.cpp
 * @brief Payload checksum computation
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/common/checksum.h"
#include "neoload/common/crypto.h"
#include "neoload/common/tillich_zemor.h"
#include "openssl_wrappers.h"
#include <openssl/evp.h>

namespace neoload {

using crypto::CryptoError;

class ChecksumCalculator::Impl {
public:
    explicit Impl(bool homomorphic) : sha(EVP_MD_CTX_new()) {
        if (!sha) {
            throw CryptoError("Failed to create payload hash context");
        }
        if (EVP_DigestInit_ex(sha.get(), EVP_sha256(), nullptr) != 1) {
            throw CryptoError("Failed to initialize payload SHA-256");
        }
        if (homomorphic) {
            tz.emplace();
        }
    }

    crypto::internal::EVP_MD_CTX_ptr sha;
    std::optional<crypto::TillichZemor::Hasher> tz;
    uint64_t size = 0;
    bool finalized = false;
};

ChecksumCalculator::ChecksumCalculator(bool homomorphic)
    : impl_(std::make_unique<Impl>(homomorphic)) {}

ChecksumCalculator::~ChecksumCalculator() = default;

void ChecksumCalculator::Update(const uint8_t* data, size_t size) {
    if (impl_->finalized) {
        throw CryptoError("Payload checksums already finalized");
    }
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(impl_->sha.get(), data, size) != 1) {
        throw CryptoError("Failed to update payload SHA-256");
    }
    if (impl_->tz) {
        impl_->tz->Update(data, size);
    }
    impl_->size += size;
}

uint64_t ChecksumCalculator::Size() const {
    return impl_->size;
}

PayloadChecksums ChecksumCalculator::Finalize() {
    if (impl_->finalized) {
        throw CryptoError("Payload checksums already finalized");
    }

    PayloadChecksums result;
    result.payload.type = ChecksumType::SHA256;
    result.payload.sum.resize(crypto::SHA256_HASH_SIZE);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->sha.get(), result.payload.sum.data(), &len) != 1 ||
        len != crypto::SHA256_HASH_SIZE) {
        throw CryptoError("Failed to finalize payload SHA-256");
    }
    impl_->finalized = true;

    if (impl_->tz) {
        Checksum hh;
        hh.type = ChecksumType::TillichZemor;
        hh.sum = impl_->tz->Finalize();
        result.homomorphic = std::move(hh);
    }
    return result;
}

PayloadChecksums ComputeChecksums(const std::vector<uint8_t>& payload, bool homomorphic) {
    ChecksumCalculator calculator(homomorphic);
    calculator.Update(payload.data(), payload.size());
    return calculator.Finalize();
}

bool VerifyChecksum(const Checksum& checksum, const std::vector<uint8_t>& payload) {
    switch (checksum.type) {
        case ChecksumType::SHA256:
            return crypto::SHA256::Hash(payload) == checksum.sum;
        case ChecksumType::TillichZemor:
            return crypto::TillichZemor::Sum(payload) == checksum.sum;
        default:
            return false;
    }
}

} // namespace neoload
