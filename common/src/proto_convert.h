/**
 * @file proto_convert.h
 * @brief Conversion between public structs and protobuf messages
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_PROTO_CONVERT_H
#define NEOLOAD_PROTO_CONVERT_H

#include "neoload/common/checksum.h"
#include "neoload/common/ids.h"
#include "neoload/common/session.h"
#include "neoload/common/signature.h"
#include "refs.pb.h"
#include "session.pb.h"
#include <google/protobuf/message_lite.h>
#include <cstdint>
#include <vector>

namespace neoload {
namespace internal {

void ToProto(const ContainerID& id, ::neoload::proto::ContainerID* proto);
void ToProto(const ObjectID& id, ::neoload::proto::ObjectID* proto);
void ToProto(const OwnerID& id, ::neoload::proto::OwnerID* proto);
void ToProto(const Checksum& checksum, ::neoload::proto::Checksum* proto);
void ToProto(const Signature& signature, ::neoload::proto::Signature* proto);
void ToProto(const SessionToken& token, ::neoload::proto::SessionToken* proto);

/**
 * @brief Serialize with deterministic field order
 * @return false if the message could not be written
 */
bool SerializeDeterministic(const google::protobuf::MessageLite& message, std::vector<uint8_t>* out);

} // namespace internal
} // namespace neoload

#endif // NEOLOAD_PROTO_CONVERT_H
