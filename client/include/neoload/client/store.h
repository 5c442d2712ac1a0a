/**
 * @file store.h
 * @brief Interface to the store under test
 *
 * The transport and RPC client behind these interfaces are supplied by the
 * caller. Every call takes the invocation's Context and may throw
 * TransportError or CancellationError; stream handles belong to a single
 * invocation and are not shared between threads.
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_STORE_H
#define NEOLOAD_STORE_H

#include "neoload/client/context.h"
#include "neoload/common/ids.h"
#include "neoload/common/object.h"
#include "neoload/common/session.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace neoload {

/**
 * @brief Raw key/value entry of the network configuration
 */
struct NetworkParameter {
    std::vector<uint8_t> key;
    std::vector<uint8_t> value;
};

/**
 * @brief Network information response
 */
struct NetworkInfo {
    uint64_t current_epoch = 0;
    uint64_t magic_number = 0;
    int64_t ms_per_block = 0;
    std::vector<NetworkParameter> parameters;
};

/**
 * @brief Upload stream: header, then payload chunks in order, then close
 */
class PutStream {
public:
    virtual ~PutStream() = default;

    /**
     * @return false if the store rejected the header (Close() reports why)
     */
    virtual bool WriteHeader(Context& ctx, const Object& object) = 0;

    /**
     * @return false if the store rejected the chunk (Close() reports why)
     */
    virtual bool WriteChunk(Context& ctx, const uint8_t* data, size_t size) = 0;

    /**
     * @brief Finalize the upload
     * @return Identifier of the stored object
     * @throws TransportError with the store's reason on failure
     */
    virtual ObjectID Close(Context& ctx) = 0;
};

/**
 * @brief Download stream: header, then payload chunks until a zero-length read
 */
class GetStream {
public:
    virtual ~GetStream() = default;

    /**
     * @return Object header, or nullopt if it could not be read (Close() reports why)
     */
    virtual std::optional<Object> ReadHeader(Context& ctx) = 0;

    /**
     * @brief Read the next payload bytes into buffer
     * @return Number of bytes read; 0 signals end of payload
     */
    virtual size_t ReadChunk(Context& ctx, uint8_t* buffer, size_t capacity) = 0;

    /**
     * @throws TransportError with the store's reason on failure
     */
    virtual void Close(Context& ctx) = 0;
};

/**
 * @brief Connection to the store
 */
class StoreConnection {
public:
    virtual ~StoreConnection() = default;

    virtual NetworkInfo QueryNetworkInfo(Context& ctx) = 0;

    /**
     * @param token PUT-scoped session token, or nullptr for objects signed by the caller
     */
    virtual std::unique_ptr<PutStream> OpenPutStream(Context& ctx, const SessionToken* token) = 0;

    /**
     * @param token GET-scoped session token, or nullptr
     */
    virtual std::unique_ptr<GetStream> OpenGetStream(
        Context& ctx,
        const ContainerID& container,
        const ObjectID& object,
        const SessionToken* token
    ) = 0;
};

} // namespace neoload

#endif // NEOLOAD_STORE_H
