/**
 * @file object.cpp
 * @brief Object header encoding, identity and signing
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/common/object.h"
#include "neoload/common/crypto.h"
#include "neoload/common/errors.h"
#include "neoload/common/limits.h"
#include "object.pb.h"
#include "proto_convert.h"
#include <glog/logging.h>

namespace neoload {

namespace {

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
bool IsValidUTF8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= s.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

void ValidateAttributes(const std::vector<Attribute>& attributes) {
    for (const auto& attr : attributes) {
        if (attr.key.empty()) {
            throw IdentityComputationError("empty attribute key");
        }
        if (attr.value.empty()) {
            throw IdentityComputationError("empty value of attribute " + attr.key);
        }
        if (!IsValidUTF8(attr.key) || !IsValidUTF8(attr.value)) {
            throw IdentityComputationError("attribute " + attr.key + " is not valid UTF-8");
        }
    }
}

void ToProto(const ObjectHeader& header, ::neoload::proto::Header* proto) {
    auto* version = proto->mutable_version();
    version->set_major(header.version.major);
    version->set_minor(header.version.minor);

    if (!header.container.IsEmpty()) {
        internal::ToProto(header.container, proto->mutable_container_id());
    }
    if (!header.owner.IsEmpty()) {
        internal::ToProto(header.owner, proto->mutable_owner_id());
    }
    proto->set_creation_epoch(header.creation_epoch);
    proto->set_payload_length(header.payload_size);
    if (header.payload_checksum) {
        internal::ToProto(*header.payload_checksum, proto->mutable_payload_hash());
    }
    proto->set_object_type(static_cast<::neoload::proto::ObjectType>(header.type));
    if (header.homomorphic_checksum) {
        internal::ToProto(*header.homomorphic_checksum, proto->mutable_homomorphic_hash());
    }
    if (header.session_token) {
        internal::ToProto(*header.session_token, proto->mutable_session_token());
    }
    for (const auto& attr : header.attributes) {
        auto* a = proto->add_attributes();
        a->set_key(attr.key);
        a->set_value(attr.value);
    }
}

} // anonymous namespace

Version Version::Current() {
    return Version{limits::API_VERSION_MAJOR, limits::API_VERSION_MINOR};
}

std::vector<Attribute> AttributesFromMap(const std::map<std::string, std::string>& attributes) {
    std::vector<Attribute> result;
    result.reserve(attributes.size());
    for (const auto& [key, value] : attributes) {
        result.push_back(Attribute{key, value});
    }
    return result;
}

// ============================================================================
// Encoding and identity
// ============================================================================

std::vector<uint8_t> MarshalHeader(const ObjectHeader& header) {
    ValidateAttributes(header.attributes);

    ::neoload::proto::Header proto;
    ToProto(header, &proto);

    std::vector<uint8_t> out;
    if (!internal::SerializeDeterministic(proto, &out)) {
        throw IdentityComputationError("failed to encode object header");
    }
    return out;
}

ObjectID ComputeObjectID(const ObjectHeader& header) {
    return ObjectID::FromBytes(crypto::SHA256::Hash(MarshalHeader(header)));
}

std::vector<uint8_t> MarshalObjectID(const ObjectID& id) {
    ::neoload::proto::ObjectID proto;
    internal::ToProto(id, &proto);

    std::vector<uint8_t> out;
    if (!internal::SerializeDeterministic(proto, &out)) {
        throw IdentityComputationError("failed to encode object ID");
    }
    return out;
}

void CheckPayloadSize(uint64_t size, uint64_t limit) {
    if (size > limit) {
        throw PayloadTooLarge(size, limit);
    }
}

std::vector<uint8_t> Object::Marshal() const {
    ::neoload::proto::Object proto;
    ToProto(header_, proto.mutable_header());
    if (id_) {
        internal::ToProto(*id_, proto.mutable_object_id());
    }
    if (signature_) {
        internal::ToProto(*signature_, proto.mutable_signature());
    }

    std::vector<uint8_t> out;
    if (!internal::SerializeDeterministic(proto, &out)) {
        throw IdentityComputationError("failed to encode object");
    }
    return out;
}

// ============================================================================
// ObjectBuilder
// ============================================================================

ObjectBuilder::ObjectBuilder(const crypto::PrivateKey& signing_key)
    : signing_key_(signing_key) {}

ObjectHeader ObjectBuilder::BuildHeader(
    const ContainerID& container,
    const OwnerID& owner,
    uint64_t payload_size,
    uint64_t epoch,
    const Checksum& checksum,
    const std::optional<Checksum>& homomorphic_checksum
) {
    ObjectHeader header;
    header.version = Version::Current();
    header.type = ObjectType::Regular;
    header.container = container;
    header.owner = owner;
    header.payload_size = payload_size;
    header.creation_epoch = epoch;
    header.payload_checksum = checksum;
    header.homomorphic_checksum = homomorphic_checksum;
    return header;
}

Object ObjectBuilder::BuildDelegated(
    const ContainerID& container,
    const OwnerID& owner,
    uint64_t payload_size,
    const std::vector<Attribute>& attributes
) {
    ValidateAttributes(attributes);

    Object object;
    object.header_.version = Version::Current();
    object.header_.type = ObjectType::Regular;
    object.header_.container = container;
    object.header_.owner = owner;
    object.header_.payload_size = payload_size;
    object.header_.attributes = attributes;
    return object;
}

Object ObjectBuilder::Finalize(const ObjectHeader& header, const std::vector<Attribute>& attributes) const {
    Object object;
    object.header_ = header;
    object.header_.attributes = attributes;

    ObjectID id = ComputeObjectID(object.header_);

    try {
        object.signature_ = SignData(signing_key_, MarshalObjectID(id));
    } catch (const crypto::CryptoError& e) {
        throw SignatureError(std::string("failed to sign object: ") + e.what());
    }
    object.id_ = std::move(id);

    VLOG(2) << "Finalized object " << object.id_->ToString() << " with "
            << attributes.size() << " attributes";
    return object;
}

void VerifyObject(const Object& object) {
    if (!object.ID()) {
        throw IdentityComputationError("object has no identifier");
    }
    if (ComputeObjectID(object.Header()) != *object.ID()) {
        throw IdentityComputationError("object identifier does not match header");
    }
    if (!object.GetSignature()) {
        throw SignatureError("object is not signed");
    }
    if (!VerifyData(*object.GetSignature(), MarshalObjectID(*object.ID()))) {
        throw SignatureError("invalid object signature");
    }
}

} // namespace neoload
