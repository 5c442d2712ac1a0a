/**
 * @file gf127.cpp
 * @brief GF(2^127) and SL2 arithmetic
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gf127.h"
#include "neoload/common/crypto.h"

namespace neoload {
namespace crypto {
namespace internal {

namespace {

constexpr uint64_t MSB = 1ULL << 63;

// x^127 = x^63 + 1
constexpr uint64_t REDUCTION_LO = MSB | 1ULL;

void PutUint64BE(uint8_t* out, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
}

uint64_t GetUint64BE(const uint8_t* in) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | in[i];
    }
    return v;
}

} // anonymous namespace

// ============================================================================
// GF127
// ============================================================================

GF127 GF127::MulX() const {
    uint64_t hi = (hi_ << 1) | (lo_ >> 63);
    uint64_t lo = lo_ << 1;
    if (hi & MSB) {
        hi &= ~MSB;
        lo ^= REDUCTION_LO;
    }
    return GF127(lo, hi);
}

GF127 GF127::operator*(const GF127& other) const {
    GF127 result;
    for (int i = 126; i >= 0; --i) {
        result = result.MulX();
        uint64_t word = i >= 64 ? other.hi_ : other.lo_;
        if ((word >> (i % 64)) & 1) {
            result += *this;
        }
    }
    return result;
}

void GF127::ToBytes(uint8_t* out) const {
    PutUint64BE(out, hi_);
    PutUint64BE(out + 8, lo_);
}

GF127 GF127::FromBytes(const uint8_t* in) {
    uint64_t hi = GetUint64BE(in);
    uint64_t lo = GetUint64BE(in + 8);
    if (hi & MSB) {
        throw CryptoError("GF(2^127) element out of range");
    }
    return GF127(lo, hi);
}

// ============================================================================
// SL2
// ============================================================================

SL2 SL2::Identity() {
    SL2 s;
    s.m[0][0] = GF127::One();
    s.m[1][1] = GF127::One();
    return s;
}

SL2 SL2::operator*(const SL2& other) const {
    SL2 r;
    for (int i = 0; i < 2; ++i) {
        for (int j = 0; j < 2; ++j) {
            r.m[i][j] = m[i][0] * other.m[0][j] + m[i][1] * other.m[1][j];
        }
    }
    return r;
}

bool SL2::operator==(const SL2& other) const {
    return m[0][0] == other.m[0][0] && m[0][1] == other.m[0][1] &&
           m[1][0] == other.m[1][0] && m[1][1] == other.m[1][1];
}

void SL2::MulBitRight(bool bit) {
    // A = [[x, 1], [1, 0]], B = [[x, x+1], [1, 1]]
    for (int row = 0; row < 2; ++row) {
        GF127 c0 = m[row][0];
        GF127 c1 = m[row][1];
        GF127 first = c0.MulX() + c1;
        m[row][0] = first;
        m[row][1] = bit ? first + c0 : c0;
    }
}

void SL2::MulByteRight(uint8_t byte) {
    for (int i = 7; i >= 0; --i) {
        MulBitRight(((byte >> i) & 1) != 0);
    }
}

void SL2::ToBytes(uint8_t* out) const {
    m[0][0].ToBytes(out);
    m[0][1].ToBytes(out + GF127::BYTE_SIZE);
    m[1][0].ToBytes(out + 2 * GF127::BYTE_SIZE);
    m[1][1].ToBytes(out + 3 * GF127::BYTE_SIZE);
}

SL2 SL2::FromBytes(const uint8_t* in) {
    SL2 s;
    s.m[0][0] = GF127::FromBytes(in);
    s.m[0][1] = GF127::FromBytes(in + GF127::BYTE_SIZE);
    s.m[1][0] = GF127::FromBytes(in + 2 * GF127::BYTE_SIZE);
    s.m[1][1] = GF127::FromBytes(in + 3 * GF127::BYTE_SIZE);
    return s;
}

} // namespace internal
} // namespace crypto
} // namespace neoload
