/**
 * @file limits.h
 * @brief Sizes and constants of the store's object protocol
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace neoload {
namespace limits {

// ============================================================================
// Transfer
// ============================================================================

/**
 * @brief Chunk buffer size used when the caller configures zero
 */
constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;

// ============================================================================
// Identifiers
// ============================================================================

constexpr size_t CONTAINER_ID_SIZE = 32;     // SHA-256
constexpr size_t OBJECT_ID_SIZE = 32;        // SHA-256 of the header
constexpr size_t OWNER_ID_SIZE = 25;         // prefix || hash160 || checksum
constexpr size_t SESSION_ID_SIZE = 16;       // UUID

constexpr uint8_t OWNER_ID_PREFIX = 0x35;    // N3 address version
constexpr size_t OWNER_ID_CHECKSUM_SIZE = 4;

// ============================================================================
// Checksums
// ============================================================================

constexpr size_t SHA256_CHECKSUM_SIZE = 32;
constexpr size_t TZ_CHECKSUM_SIZE = 64;      // 2x2 matrix of GF(2^127) elements

// ============================================================================
// Network parameters
// ============================================================================

constexpr size_t MAX_OBJECT_SIZE_VALUE_SIZE = 8;   // little-endian uint64
constexpr size_t MAX_BOOL_PARAMETER_SIZE = 32;     // larger byte arrays do not decode to bool

// ============================================================================
// Protocol version written into object headers
// ============================================================================

constexpr uint32_t API_VERSION_MAJOR = 2;
constexpr uint32_t API_VERSION_MINOR = 13;

}  // namespace limits
}  // namespace neoload
