/**
 * @file gf127.h
 * @brief Arithmetic in GF(2^127) and SL(2, GF(2^127)) for Tillich-Zemor hashing
 *
 * Field polynomial: x^127 + x^63 + 1.
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_GF127_H
#define NEOLOAD_GF127_H

#include <cstddef>
#include <cstdint>

namespace neoload {
namespace crypto {
namespace internal {

/**
 * @brief Element of GF(2^127), bit i is the coefficient of x^i
 */
class GF127 {
public:
    static constexpr size_t BYTE_SIZE = 16;

    GF127() = default;
    GF127(uint64_t lo, uint64_t hi) : lo_(lo), hi_(hi) {}

    static GF127 Zero() { return GF127(0, 0); }
    static GF127 One() { return GF127(1, 0); }
    static GF127 X() { return GF127(2, 0); }

    GF127 operator+(const GF127& other) const { return GF127(lo_ ^ other.lo_, hi_ ^ other.hi_); }
    GF127& operator+=(const GF127& other) {
        lo_ ^= other.lo_;
        hi_ ^= other.hi_;
        return *this;
    }

    GF127 operator*(const GF127& other) const;

    /**
     * @brief Multiply by x with reduction
     */
    GF127 MulX() const;

    bool operator==(const GF127& other) const { return lo_ == other.lo_ && hi_ == other.hi_; }
    bool operator!=(const GF127& other) const { return !(*this == other); }

    /**
     * @brief Write 16 bytes, high word first, big-endian
     */
    void ToBytes(uint8_t* out) const;

    /**
     * @throws CryptoError if bit 127 is set
     */
    static GF127 FromBytes(const uint8_t* in);

    uint64_t lo() const { return lo_; }
    uint64_t hi() const { return hi_; }

private:
    uint64_t lo_ = 0;
    uint64_t hi_ = 0;
};

/**
 * @brief 2x2 matrix over GF(2^127)
 */
class SL2 {
public:
    static constexpr size_t BYTE_SIZE = 4 * GF127::BYTE_SIZE;

    static SL2 Identity();

    SL2 operator*(const SL2& other) const;
    bool operator==(const SL2& other) const;
    bool operator!=(const SL2& other) const { return !(*this == other); }

    /**
     * @brief Right-multiply by A (bit 0) or B (bit 1)
     */
    void MulBitRight(bool bit);

    /**
     * @brief Right-multiply by the generator sequence of one byte, MSB first
     */
    void MulByteRight(uint8_t byte);

    void ToBytes(uint8_t* out) const;
    static SL2 FromBytes(const uint8_t* in);

    GF127 m[2][2];
};

} // namespace internal
} // namespace crypto
} // namespace neoload

#endif // NEOLOAD_GF127_H
