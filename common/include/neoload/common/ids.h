/**
 * @file ids.h
 * @brief Container, object and owner identifiers with Base58 text form
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_IDS_H
#define NEOLOAD_IDS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace neoload {

namespace crypto {
class PublicKey;
}

/**
 * @brief Encode bytes with the Bitcoin Base58 alphabet
 */
std::string Base58Encode(const std::vector<uint8_t>& data);

/**
 * @brief Decode a Base58 string
 * @throws ConfigurationError on characters outside the alphabet
 */
std::vector<uint8_t> Base58Decode(const std::string& text);

/**
 * @brief 32-byte container identifier
 */
class ContainerID {
public:
    ContainerID() = default;

    /**
     * @throws ConfigurationError if bytes are not exactly 32 bytes long
     */
    static ContainerID FromBytes(const std::vector<uint8_t>& bytes);

    /**
     * @brief Parse Base58 text form
     * @throws ConfigurationError on malformed input
     */
    static ContainerID DecodeString(const std::string& text);

    std::string ToString() const;
    const std::vector<uint8_t>& Bytes() const { return value_; }
    bool IsEmpty() const { return value_.empty(); }

    bool operator==(const ContainerID& other) const { return value_ == other.value_; }
    bool operator!=(const ContainerID& other) const { return value_ != other.value_; }
    bool operator<(const ContainerID& other) const { return value_ < other.value_; }

private:
    std::vector<uint8_t> value_;
};

/**
 * @brief 32-byte object identifier (SHA-256 of the canonical header)
 */
class ObjectID {
public:
    ObjectID() = default;

    /**
     * @throws ConfigurationError if bytes are not exactly 32 bytes long
     */
    static ObjectID FromBytes(const std::vector<uint8_t>& bytes);

    /**
     * @brief Parse Base58 text form
     * @throws ConfigurationError on malformed input
     */
    static ObjectID DecodeString(const std::string& text);

    std::string ToString() const;
    const std::vector<uint8_t>& Bytes() const { return value_; }
    bool IsEmpty() const { return value_.empty(); }

    bool operator==(const ObjectID& other) const { return value_ == other.value_; }
    bool operator!=(const ObjectID& other) const { return value_ != other.value_; }
    bool operator<(const ObjectID& other) const { return value_ < other.value_; }

private:
    std::vector<uint8_t> value_;
};

/**
 * @brief 25-byte owner identifier derived from a public key
 *
 * Layout: 0x35 || RIPEMD160(SHA256(verification script)) || 4-byte checksum.
 */
class OwnerID {
public:
    OwnerID() = default;

    /**
     * @brief Derive owner of a single-signature account
     */
    static OwnerID FromPublicKey(const crypto::PublicKey& key);

    /**
     * @throws ConfigurationError on wrong size, prefix or checksum
     */
    static OwnerID FromBytes(const std::vector<uint8_t>& bytes);

    static OwnerID DecodeString(const std::string& text);

    std::string ToString() const;
    const std::vector<uint8_t>& Bytes() const { return value_; }
    bool IsEmpty() const { return value_.empty(); }

    bool operator==(const OwnerID& other) const { return value_ == other.value_; }
    bool operator!=(const OwnerID& other) const { return value_ != other.value_; }

private:
    std::vector<uint8_t> value_;
};

/**
 * @brief Container plus optional object: the target of an operation
 */
struct ObjectAddress {
    ContainerID container;
    std::optional<ObjectID> object;

    /**
     * @brief "<container>/<object>" or "<container>" when no object is set
     */
    std::string ToString() const;
};

} // namespace neoload

#endif // NEOLOAD_IDS_H
