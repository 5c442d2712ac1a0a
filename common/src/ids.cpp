/**
 * @file ids.cpp
 * @brief Identifier encoding and owner derivation
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/common/ids.h"
#include "neoload/common/crypto.h"
#include "neoload/common/errors.h"
#include "neoload/common/limits.h"
#include <algorithm>
#include <iterator>

namespace neoload {

namespace {

constexpr const char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Single-signature verification script: PUSHDATA1 33 <key> SYSCALL System.Crypto.CheckSig
constexpr uint8_t SCRIPT_PUSHDATA1 = 0x0C;
constexpr uint8_t SCRIPT_SYSCALL = 0x41;
constexpr uint8_t CHECKSIG_INTEROP_ID[] = {0x56, 0xE7, 0xB3, 0x27};

int Base58Index(char c) {
    const char* pos = std::char_traits<char>::find(BASE58_ALPHABET, 58, c);
    return pos ? static_cast<int>(pos - BASE58_ALPHABET) : -1;
}

std::vector<uint8_t> DecodeFixed(const std::string& text, size_t size, const char* what) {
    if (text.empty()) {
        throw ConfigurationError(std::string("empty ") + what);
    }
    auto bytes = Base58Decode(text);
    if (bytes.size() != size) {
        throw ConfigurationError(std::string("invalid ") + what + " length " +
                                 std::to_string(bytes.size()) + " (expected " +
                                 std::to_string(size) + ")");
    }
    return bytes;
}

std::vector<uint8_t> OwnerChecksum(const std::vector<uint8_t>& body) {
    auto digest = crypto::SHA256::Hash(crypto::SHA256::Hash(body));
    digest.resize(limits::OWNER_ID_CHECKSUM_SIZE);
    return digest;
}

} // anonymous namespace

// ============================================================================
// Base58
// ============================================================================

std::string Base58Encode(const std::vector<uint8_t>& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        ++zeros;
    }

    // log(256) / log(58) ~= 1.37
    std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1);
    size_t length = 0;
    for (size_t i = zeros; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + (digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result(zeros, '1');
    for (; it != digits.end(); ++it) {
        result += BASE58_ALPHABET[*it];
    }
    return result;
}

std::vector<uint8_t> Base58Decode(const std::string& text) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') {
        ++zeros;
    }

    // log(58) / log(256) ~= 0.733
    std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1);
    size_t length = 0;
    for (size_t i = zeros; i < text.size(); ++i) {
        int carry = Base58Index(text[i]);
        if (carry < 0) {
            throw ConfigurationError("invalid Base58 character in \"" + text + "\"");
        }
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + (bytes.size() - length);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result(zeros, 0x00);
    result.insert(result.end(), it, bytes.end());
    return result;
}

// ============================================================================
// ContainerID / ObjectID
// ============================================================================

ContainerID ContainerID::FromBytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != limits::CONTAINER_ID_SIZE) {
        throw ConfigurationError("invalid container ID length " + std::to_string(bytes.size()));
    }
    ContainerID id;
    id.value_ = bytes;
    return id;
}

ContainerID ContainerID::DecodeString(const std::string& text) {
    ContainerID id;
    id.value_ = DecodeFixed(text, limits::CONTAINER_ID_SIZE, "container ID");
    return id;
}

std::string ContainerID::ToString() const {
    return Base58Encode(value_);
}

ObjectID ObjectID::FromBytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != limits::OBJECT_ID_SIZE) {
        throw ConfigurationError("invalid object ID length " + std::to_string(bytes.size()));
    }
    ObjectID id;
    id.value_ = bytes;
    return id;
}

ObjectID ObjectID::DecodeString(const std::string& text) {
    ObjectID id;
    id.value_ = DecodeFixed(text, limits::OBJECT_ID_SIZE, "object ID");
    return id;
}

std::string ObjectID::ToString() const {
    return Base58Encode(value_);
}

// ============================================================================
// OwnerID
// ============================================================================

OwnerID OwnerID::FromPublicKey(const crypto::PublicKey& key) {
    auto compressed = key.ToCompressed();

    std::vector<uint8_t> script;
    script.reserve(compressed.size() + 7);
    script.push_back(SCRIPT_PUSHDATA1);
    script.push_back(static_cast<uint8_t>(compressed.size()));
    script.insert(script.end(), compressed.begin(), compressed.end());
    script.push_back(SCRIPT_SYSCALL);
    script.insert(script.end(), std::begin(CHECKSIG_INTEROP_ID), std::end(CHECKSIG_INTEROP_ID));

    auto hash160 = crypto::RIPEMD160::Hash(crypto::SHA256::Hash(script));

    OwnerID id;
    id.value_.push_back(limits::OWNER_ID_PREFIX);
    id.value_.insert(id.value_.end(), hash160.begin(), hash160.end());
    auto checksum = OwnerChecksum(id.value_);
    id.value_.insert(id.value_.end(), checksum.begin(), checksum.end());
    return id;
}

OwnerID OwnerID::FromBytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != limits::OWNER_ID_SIZE) {
        throw ConfigurationError("invalid owner ID length " + std::to_string(bytes.size()));
    }
    if (bytes[0] != limits::OWNER_ID_PREFIX) {
        throw ConfigurationError("invalid owner ID prefix");
    }

    std::vector<uint8_t> body(bytes.begin(), bytes.end() - limits::OWNER_ID_CHECKSUM_SIZE);
    auto expected = OwnerChecksum(body);
    if (!std::equal(expected.begin(), expected.end(), bytes.end() - limits::OWNER_ID_CHECKSUM_SIZE)) {
        throw ConfigurationError("owner ID checksum mismatch");
    }

    OwnerID id;
    id.value_ = bytes;
    return id;
}

OwnerID OwnerID::DecodeString(const std::string& text) {
    return FromBytes(DecodeFixed(text, limits::OWNER_ID_SIZE, "owner ID"));
}

std::string OwnerID::ToString() const {
    return Base58Encode(value_);
}

// ============================================================================
// ObjectAddress
// ============================================================================

std::string ObjectAddress::ToString() const {
    std::string result = container.ToString();
    if (object) {
        result += "/" + object->ToString();
    }
    return result;
}

} // namespace neoload
