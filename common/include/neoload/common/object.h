/**
 * @file object.h
 * @brief Object headers, identity derivation and the object builder
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_OBJECT_H
#define NEOLOAD_OBJECT_H

#include "neoload/common/checksum.h"
#include "neoload/common/ids.h"
#include "neoload/common/session.h"
#include "neoload/common/signature.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace neoload {

namespace crypto {
class PrivateKey;
}

/**
 * @brief Object type, numbered as on the wire
 */
enum class ObjectType {
    Regular = 0,
    Tombstone = 1,
    StorageGroup = 2,
    Lock = 3,
    Link = 4
};

struct Version {
    uint32_t major = 0;
    uint32_t minor = 0;

    /**
     * @brief Protocol version this client writes into headers
     */
    static Version Current();

    bool operator==(const Version& other) const { return major == other.major && minor == other.minor; }
};

struct Attribute {
    std::string key;
    std::string value;

    bool operator==(const Attribute& other) const { return key == other.key && value == other.value; }
};

/**
 * @brief Convert a key/value map to attributes ordered by key
 */
std::vector<Attribute> AttributesFromMap(const std::map<std::string, std::string>& attributes);

/**
 * @brief Every header field of an object
 *
 * Identity is computed over the canonical encoding of this record, so any
 * change (including attributes) changes the object ID.
 */
struct ObjectHeader {
    Version version = Version::Current();
    ContainerID container;
    OwnerID owner;
    uint64_t creation_epoch = 0;
    uint64_t payload_size = 0;
    ObjectType type = ObjectType::Regular;
    std::optional<Checksum> payload_checksum;
    std::optional<Checksum> homomorphic_checksum;
    std::optional<SessionToken> session_token;
    std::vector<Attribute> attributes;
};

/**
 * @brief Canonical (deterministic protobuf) encoding of a header
 * @throws IdentityComputationError on malformed attributes or encoding failure
 */
std::vector<uint8_t> MarshalHeader(const ObjectHeader& header);

/**
 * @brief SHA-256 over the canonical header encoding
 * @throws IdentityComputationError on malformed attributes or encoding failure
 */
ObjectID ComputeObjectID(const ObjectHeader& header);

/**
 * @brief Canonical encoding of an object ID, the data an object signature covers
 */
std::vector<uint8_t> MarshalObjectID(const ObjectID& id);

/**
 * @brief Fail fast before any network call when the payload is too big
 * @throws PayloadTooLarge if size strictly exceeds limit
 */
void CheckPayloadSize(uint64_t size, uint64_t limit);

/**
 * @brief Immutable object header ready for transfer
 *
 * Produced by ObjectBuilder. Finalized objects carry an identifier and a
 * signature; delegated objects carry neither and are completed by the store.
 */
class Object {
public:
    const ObjectHeader& Header() const { return header_; }
    const std::optional<ObjectID>& ID() const { return id_; }
    const std::optional<Signature>& GetSignature() const { return signature_; }

    bool HasIdentity() const { return id_.has_value() && signature_.has_value(); }

    /**
     * @brief Canonical encoding of the object envelope without payload
     */
    std::vector<uint8_t> Marshal() const;

private:
    friend class ObjectBuilder;

    ObjectHeader header_;
    std::optional<ObjectID> id_;
    std::optional<Signature> signature_;
};

/**
 * @brief Assembles objects in two phases
 *
 * BuildHeader() captures the expensive payload-derived fields once;
 * Finalize() may then be called many times with different attribute sets,
 * each call deriving a fresh identity and signature.
 *
 * Holds a reference to the signing key; the key must outlive the builder.
 */
class ObjectBuilder {
public:
    explicit ObjectBuilder(const crypto::PrivateKey& signing_key);

    /**
     * @brief Populate every header field except identity, signature and attributes
     */
    static ObjectHeader BuildHeader(
        const ContainerID& container,
        const OwnerID& owner,
        uint64_t payload_size,
        uint64_t epoch,
        const Checksum& checksum,
        const std::optional<Checksum>& homomorphic_checksum
    );

    /**
     * @brief Header for a session-delegated PUT
     *
     * Carries container, owner, payload size and attributes only. The store
     * fills in checksums, epoch, identity and its own signature.
     */
    static Object BuildDelegated(
        const ContainerID& container,
        const OwnerID& owner,
        uint64_t payload_size,
        const std::vector<Attribute>& attributes
    );

    /**
     * @brief Set attributes, derive identity, sign it
     *
     * @param header Output of BuildHeader() (its attributes are replaced)
     * @param attributes Attribute set, in order
     * @return Object ready for transfer
     * @throws IdentityComputationError on malformed attributes or encoding failure
     * @throws SignatureError on invalid key material
     */
    Object Finalize(const ObjectHeader& header, const std::vector<Attribute>& attributes) const;

private:
    const crypto::PrivateKey& signing_key_;
};

/**
 * @brief Recompute identity and check signature of a finalized object
 * @throws IdentityComputationError if the identifier does not match the header
 * @throws SignatureError if the signature is missing or invalid
 */
void VerifyObject(const Object& object);

} // namespace neoload

#endif // NEOLOAD_OBJECT_H
