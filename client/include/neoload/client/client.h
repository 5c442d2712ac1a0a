/**
 * @file client.h
 * @brief Caller-facing PUT / GET / prepare surface
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_CLIENT_H
#define NEOLOAD_CLIENT_H

#include "neoload/client/context.h"
#include "neoload/client/metrics.h"
#include "neoload/client/store.h"
#include "neoload/common/crypto.h"
#include "neoload/common/errors.h"
#include "neoload/common/object.h"
#include "neoload/common/session.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace neoload {

struct PutResponse {
    bool success = false;
    std::string object_id;      ///< Base58 identifier of the stored object
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
};

struct GetResponse {
    bool success = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    uint64_t bytes_received = 0;
    uint64_t payload_size = 0;  ///< Payload size field of the received header
};

/**
 * @brief Object with metadata and checksums computed once, uploadable many times
 *
 * Every Put() sets a new attribute set, derives a fresh identity and
 * signature, and streams the shared payload. Put() is const and may be
 * called from several threads at once.
 */
class PreparedObject {
public:
    /**
     * @brief Finalize with attributes and upload
     *
     * The object is signed by the client's key and sent without a session token.
     */
    PutResponse Put(Context& ctx, const std::map<std::string, std::string>& attributes) const;

    const ObjectHeader& Header() const { return header_; }
    uint64_t PayloadSize() const { return payload_->size(); }

private:
    friend class Client;

    PreparedObject(
        std::shared_ptr<StoreConnection> store,
        std::shared_ptr<const crypto::PrivateKey> key,
        std::shared_ptr<MetricsSink> metrics,
        size_t buffer_size,
        ObjectHeader header,
        std::shared_ptr<const std::vector<uint8_t>> payload
    );

    std::shared_ptr<StoreConnection> store_;
    std::shared_ptr<const crypto::PrivateKey> key_;
    std::shared_ptr<MetricsSink> metrics_;
    size_t buffer_size_;
    ObjectHeader header_;
    std::shared_ptr<const std::vector<uint8_t>> payload_;
};

/**
 * @brief Load-generation client
 *
 * Holds only read-only configuration (signing key, base session template,
 * buffer size); each call derives its own scoped token and buffer. Call
 * SetBufferSize() before sharing the client between threads.
 *
 * Example usage:
 * @code
 * auto key = std::make_shared<const crypto::PrivateKey>(crypto::PrivateKey::LoadFromFile("wallet.pem"));
 * auto base = SessionToken::CreateTemplate(*key, session_pub, {100, 0, 0});
 * Client client(store, key, base, metrics);
 *
 * Context ctx;
 * PutResponse put = client.Put(ctx, container, {{"FileName", "a.bin"}}, payload);
 * GetResponse get = client.Get(ctx, container, put.object_id);
 * @endcode
 */
class Client {
public:
    Client(
        std::shared_ptr<StoreConnection> store,
        std::shared_ptr<const crypto::PrivateKey> key,
        SessionToken session_template,
        std::shared_ptr<MetricsSink> metrics
    );

    /**
     * @brief Set transfer chunk size in bytes
     * @param size Positive size, or 0 for the 64 KiB default
     * @throws ConfigurationError if size is negative
     */
    void SetBufferSize(int64_t size);

    size_t BufferSize() const { return buffer_size_; }

    /**
     * @brief Upload a session-delegated object
     *
     * The header carries container, owner, size and attributes only; the
     * store completes it under the PUT-scoped session token.
     */
    PutResponse Put(
        Context& ctx,
        const std::string& container_id,
        const std::map<std::string, std::string>& attributes,
        const std::vector<uint8_t>& payload
    );

    /**
     * @brief Download an object and count its payload bytes
     */
    GetResponse Get(Context& ctx, const std::string& container_id, const std::string& object_id);

    /**
     * @brief Resolve network parameters, check the size limit and checksum the payload
     *
     * @throws ConfigurationError on a malformed container identifier
     * @throws ParameterResolutionError if network parameters are unusable
     * @throws PayloadTooLarge if the payload exceeds the network limit
     * @throws TransportError, CancellationError from the parameter query
     */
    PreparedObject Prepare(Context& ctx, const std::string& container_id, std::vector<uint8_t> payload);

private:
    std::shared_ptr<StoreConnection> store_;
    std::shared_ptr<const crypto::PrivateKey> key_;
    SessionToken session_template_;
    std::shared_ptr<MetricsSink> metrics_;
    OwnerID owner_;
    size_t buffer_size_;
};

} // namespace neoload

#endif // NEOLOAD_CLIENT_H
