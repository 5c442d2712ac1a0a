/**
 * @file proto_convert.cpp
 * @brief Conversion between public structs and protobuf messages
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "proto_convert.h"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <string>

namespace neoload {
namespace internal {

void ToProto(const ContainerID& id, ::neoload::proto::ContainerID* proto) {
    proto->set_value(id.Bytes().data(), id.Bytes().size());
}

void ToProto(const ObjectID& id, ::neoload::proto::ObjectID* proto) {
    proto->set_value(id.Bytes().data(), id.Bytes().size());
}

void ToProto(const OwnerID& id, ::neoload::proto::OwnerID* proto) {
    proto->set_value(id.Bytes().data(), id.Bytes().size());
}

void ToProto(const Checksum& checksum, ::neoload::proto::Checksum* proto) {
    proto->set_type(static_cast<::neoload::proto::ChecksumType>(checksum.type));
    proto->set_sum(checksum.sum.data(), checksum.sum.size());
}

void ToProto(const Signature& signature, ::neoload::proto::Signature* proto) {
    proto->set_key(signature.key.data(), signature.key.size());
    proto->set_sign(signature.sign.data(), signature.sign.size());
    proto->set_scheme(static_cast<::neoload::proto::SignatureScheme>(signature.scheme));
}

void ToProto(const SessionToken& token, ::neoload::proto::SessionToken* proto) {
    auto* body = proto->mutable_body();
    body->set_id(token.ID().data(), token.ID().size());
    if (!token.Issuer().IsEmpty()) {
        ToProto(token.Issuer(), body->mutable_owner_id());
    }

    auto* lifetime = body->mutable_lifetime();
    lifetime->set_exp(token.Lifetime().expiration);
    lifetime->set_nbf(token.Lifetime().not_before);
    lifetime->set_iat(token.Lifetime().issued_at);

    body->set_session_key(token.SessionKey().data(), token.SessionKey().size());

    auto* context = body->mutable_object();
    context->set_verb(static_cast<::neoload::proto::ObjectSessionContext::Verb>(token.Verb()));
    auto* target = context->mutable_target();
    if (!token.Container().IsEmpty()) {
        ToProto(token.Container(), target->mutable_container());
    }
    for (const auto& oid : token.Objects()) {
        ToProto(oid, target->add_objects());
    }

    if (token.GetSignature()) {
        ToProto(*token.GetSignature(), proto->mutable_signature());
    }
}

bool SerializeDeterministic(const google::protobuf::MessageLite& message, std::vector<uint8_t>* out) {
    std::string buffer;
    {
        google::protobuf::io::StringOutputStream stream(&buffer);
        google::protobuf::io::CodedOutputStream coded(&stream);
        coded.SetSerializationDeterministic(true);
        if (!message.SerializeToCodedStream(&coded) || coded.HadError()) {
            return false;
        }
    }
    out->assign(buffer.begin(), buffer.end());
    return true;
}

} // namespace internal
} // namespace neoload
