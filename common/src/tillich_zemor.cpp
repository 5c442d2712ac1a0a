/**
 * @file tillich_zemor.cpp
 * @brief Tillich-Zemor hash implementation
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/common/tillich_zemor.h"
#include "neoload/common/crypto.h"
#include "gf127.h"
#include <string>

namespace neoload {
namespace crypto {

using namespace internal;

namespace {

SL2 Decode(const std::vector<uint8_t>& hash) {
    if (hash.size() != TZ_HASH_SIZE) {
        throw CryptoError("Invalid Tillich-Zemor hash size " + std::to_string(hash.size()));
    }
    return SL2::FromBytes(hash.data());
}

std::vector<uint8_t> Encode(const SL2& s) {
    std::vector<uint8_t> out(TZ_HASH_SIZE);
    s.ToBytes(out.data());
    return out;
}

} // anonymous namespace

std::vector<uint8_t> TillichZemor::Sum(const std::vector<uint8_t>& data) {
    Hasher hasher;
    hasher.Update(data);
    return hasher.Finalize();
}

std::vector<uint8_t> TillichZemor::Concat(const std::vector<std::vector<uint8_t>>& hashes) {
    SL2 result = SL2::Identity();
    for (const auto& h : hashes) {
        result = result * Decode(h);
    }
    return Encode(result);
}

bool TillichZemor::Validate(
    const std::vector<uint8_t>& hash,
    const std::vector<std::vector<uint8_t>>& parts
) {
    return Decode(hash) == Decode(Concat(parts));
}

// ============================================================================
// Streaming Hasher
// ============================================================================

class TillichZemor::Hasher::Impl {
public:
    SL2 state = SL2::Identity();
    bool finalized = false;
};

TillichZemor::Hasher::Hasher() : impl_(std::make_unique<Impl>()) {}

TillichZemor::Hasher::~Hasher() = default;

TillichZemor::Hasher::Hasher(Hasher&&) noexcept = default;
TillichZemor::Hasher& TillichZemor::Hasher::operator=(Hasher&&) noexcept = default;

void TillichZemor::Hasher::Update(const uint8_t* data, size_t size) {
    if (impl_->finalized) {
        throw CryptoError("Hasher already finalized");
    }

    for (size_t i = 0; i < size; ++i) {
        impl_->state.MulByteRight(data[i]);
    }
}

std::vector<uint8_t> TillichZemor::Hasher::Finalize() {
    if (impl_->finalized) {
        throw CryptoError("Hasher already finalized");
    }

    impl_->finalized = true;
    return Encode(impl_->state);
}

} // namespace crypto
} // namespace neoload
