/**
 * @file client.cpp
 * @brief Client facade and prepared objects
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/client/client.h"
#include "neoload/client/network_parameters.h"
#include "neoload/client/transfer.h"
#include "neoload/common/checksum.h"
#include "neoload/common/limits.h"
#include <glog/logging.h>

namespace neoload {

namespace {

PutResponse PutFailure(const Error& e) {
    PutResponse response;
    response.success = false;
    response.error = e.what();
    response.error_kind = e.kind();
    return response;
}

GetResponse GetFailure(const Error& e) {
    GetResponse response;
    response.success = false;
    response.error = e.what();
    response.error_kind = e.kind();
    return response;
}

// A request rejected before any stream opens still counts as one failed attempt
void ReportRejected(MetricsSink& sink, const char* total, const char* fails) {
    sink.Report(total, 1);
    sink.Report(fails, 1);
}

} // anonymous namespace

// ============================================================================
// Client
// ============================================================================

Client::Client(
    std::shared_ptr<StoreConnection> store,
    std::shared_ptr<const crypto::PrivateKey> key,
    SessionToken session_template,
    std::shared_ptr<MetricsSink> metrics
)
    : store_(std::move(store)),
      key_(std::move(key)),
      session_template_(std::move(session_template)),
      metrics_(std::move(metrics)),
      buffer_size_(limits::DEFAULT_BUFFER_SIZE) {
    if (!store_ || !key_ || !metrics_) {
        throw ConfigurationError("client requires a store, a signing key and a metrics sink");
    }
    try {
        owner_ = OwnerID::FromPublicKey(crypto::PublicKey::FromPrivateKey(*key_));
    } catch (const crypto::CryptoError& e) {
        throw ConfigurationError(std::string("unusable signing key: ") + e.what());
    }
}

void Client::SetBufferSize(int64_t size) {
    if (size < 0) {
        throw ConfigurationError("buffer size must be non-negative, got " + std::to_string(size));
    }
    buffer_size_ = size == 0 ? limits::DEFAULT_BUFFER_SIZE : static_cast<size_t>(size);
}

PutResponse Client::Put(
    Context& ctx,
    const std::string& container_id,
    const std::map<std::string, std::string>& attributes,
    const std::vector<uint8_t>& payload
) {
    ContainerID container;
    SessionToken token;
    Object object;
    try {
        container = ContainerID::DecodeString(container_id);
        token = SessionAuthorizer(*key_).Scope(session_template_, ObjectVerb::Put, ObjectAddress{container, std::nullopt});
        object = ObjectBuilder::BuildDelegated(container, owner_, payload.size(), AttributesFromMap(attributes));
    } catch (const Error& e) {
        LOG(WARNING) << "PUT to " << container_id << " rejected before transfer: " << e.what();
        ReportRejected(*metrics_, metrics::OBJ_PUT_TOTAL, metrics::OBJ_PUT_FAILS);
        return PutFailure(e);
    }

    TransferEngine engine(*store_, *metrics_, buffer_size_);
    BytesSource source(payload);
    TransferResult result = engine.Put(ctx, object, source, &token);

    PutResponse response;
    response.success = result.success;
    response.error = result.error;
    response.error_kind = result.error_kind;
    if (result.stored_id) {
        response.object_id = result.stored_id->ToString();
    }
    return response;
}

GetResponse Client::Get(Context& ctx, const std::string& container_id, const std::string& object_id) {
    ContainerID container;
    ObjectID id;
    SessionToken token;
    try {
        container = ContainerID::DecodeString(container_id);
        id = ObjectID::DecodeString(object_id);
        token = SessionAuthorizer(*key_).Scope(session_template_, ObjectVerb::Get, ObjectAddress{container, id});
    } catch (const Error& e) {
        LOG(WARNING) << "GET " << container_id << "/" << object_id << " rejected before transfer: " << e.what();
        ReportRejected(*metrics_, metrics::OBJ_GET_TOTAL, metrics::OBJ_GET_FAILS);
        return GetFailure(e);
    }

    TransferEngine engine(*store_, *metrics_, buffer_size_);
    TransferResult result = engine.Get(ctx, container, id, &token);

    GetResponse response;
    response.success = result.success;
    response.error = result.error;
    response.error_kind = result.error_kind;
    response.bytes_received = result.bytes;
    if (result.header) {
        response.payload_size = result.header->payload_size;
    }
    return response;
}

PreparedObject Client::Prepare(Context& ctx, const std::string& container_id, std::vector<uint8_t> payload) {
    ContainerID container = ContainerID::DecodeString(container_id);

    NetworkParameters params = NetworkParameterResolver(*store_).Resolve(ctx);
    CheckPayloadSize(payload.size(), params.max_object_size);

    PayloadChecksums sums = ComputeChecksums(payload, !params.homomorphic_hashing_disabled);
    ObjectHeader header = ObjectBuilder::BuildHeader(
        container, owner_, payload.size(), params.current_epoch, sums.payload, sums.homomorphic);

    LOG(INFO) << "Prepared object in " << container.ToString() << ": " << payload.size()
              << " bytes, epoch " << params.current_epoch
              << (sums.homomorphic ? ", homomorphic checksum" : "");

    return PreparedObject(
        store_, key_, metrics_, buffer_size_, std::move(header),
        std::make_shared<const std::vector<uint8_t>>(std::move(payload)));
}

// ============================================================================
// PreparedObject
// ============================================================================

PreparedObject::PreparedObject(
    std::shared_ptr<StoreConnection> store,
    std::shared_ptr<const crypto::PrivateKey> key,
    std::shared_ptr<MetricsSink> metrics,
    size_t buffer_size,
    ObjectHeader header,
    std::shared_ptr<const std::vector<uint8_t>> payload
)
    : store_(std::move(store)),
      key_(std::move(key)),
      metrics_(std::move(metrics)),
      buffer_size_(buffer_size),
      header_(std::move(header)),
      payload_(std::move(payload)) {}

PutResponse PreparedObject::Put(Context& ctx, const std::map<std::string, std::string>& attributes) const {
    Object object;
    try {
        object = ObjectBuilder(*key_).Finalize(header_, AttributesFromMap(attributes));
    } catch (const Error& e) {
        LOG(WARNING) << "Prepared object rejected before transfer: " << e.what();
        ReportRejected(*metrics_, metrics::OBJ_PUT_TOTAL, metrics::OBJ_PUT_FAILS);
        return PutFailure(e);
    }

    TransferEngine engine(*store_, *metrics_, buffer_size_);
    BytesSource source(*payload_);
    TransferResult result = engine.Put(ctx, object, source, nullptr);

    PutResponse response;
    response.success = result.success;
    response.error = result.error;
    response.error_kind = result.error_kind;
    if (result.success) {
        response.object_id = object.ID()->ToString();
        if (result.stored_id && *result.stored_id != *object.ID()) {
            LOG(WARNING) << "Store returned identifier " << result.stored_id->ToString()
                         << " for object " << response.object_id;
        }
    }
    return response;
}

} // namespace neoload
