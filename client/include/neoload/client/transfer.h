/**
 * @file transfer.h
 * @brief Chunked upload and download with metrics
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_TRANSFER_H
#define NEOLOAD_TRANSFER_H

#include "neoload/client/context.h"
#include "neoload/client/metrics.h"
#include "neoload/client/store.h"
#include "neoload/common/errors.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace neoload {

/**
 * @brief Sequential reader over an upload payload
 */
class PayloadSource {
public:
    virtual ~PayloadSource() = default;

    /**
     * @brief Copy up to capacity bytes into buffer
     * @return Bytes copied; 0 at end of payload
     */
    virtual size_t Read(uint8_t* buffer, size_t capacity) = 0;

    virtual uint64_t Size() const = 0;
};

/**
 * @brief PayloadSource over a byte vector the caller keeps alive
 */
class BytesSource : public PayloadSource {
public:
    explicit BytesSource(const std::vector<uint8_t>& data)
        : data_(data) {}

    size_t Read(uint8_t* buffer, size_t capacity) override;
    uint64_t Size() const override { return data_.size(); }

private:
    const std::vector<uint8_t>& data_;
    size_t offset_ = 0;
};

/**
 * @brief Outcome of one transfer
 */
struct TransferResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::optional<ObjectID> stored_id;      ///< PUT: identifier returned by the store
    std::optional<ObjectHeader> header;     ///< GET: header of the received object
    uint64_t bytes = 0;                     ///< Payload bytes streamed
};

/**
 * @brief Streams objects to and from the store
 *
 * Every Put()/Get() allocates its own transfer buffer of buffer_size bytes,
 * so one engine may serve concurrent invocations. Each invocation increments
 * the total counter once and, unless it succeeds, the failure counter once;
 * the duration and data volume are reported on success only.
 */
class TransferEngine {
public:
    /**
     * @throws ConfigurationError if buffer_size is zero
     */
    TransferEngine(StoreConnection& store, MetricsSink& metrics, size_t buffer_size);

    /**
     * @brief Upload header, then the payload in chunks of at most buffer_size bytes
     * @param token Scoped PUT token for delegated objects, nullptr otherwise
     */
    TransferResult Put(Context& ctx, const Object& object, PayloadSource& payload, const SessionToken* token);

    /**
     * @brief Download an object, discarding the payload
     * @param token Scoped GET token, or nullptr
     */
    TransferResult Get(Context& ctx, const ContainerID& container, const ObjectID& id, const SessionToken* token);

    size_t BufferSize() const { return buffer_size_; }

private:
    StoreConnection& store_;
    MetricsSink& metrics_;
    size_t buffer_size_;
};

} // namespace neoload

#endif // NEOLOAD_TRANSFER_H
