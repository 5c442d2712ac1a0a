/**
 * @file transfer.cpp
 * @brief Transfer engine
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/client/transfer.h"
#include <glog/logging.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <exception>
#include <memory>

namespace neoload {

namespace {

double ElapsedMillis(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

TransferResult Failure(const Error& e) {
    TransferResult result;
    result.success = false;
    result.error_kind = e.kind();
    result.error = e.what();
    return result;
}

// Close a stream abandoned mid-transfer; the original failure is what gets reported
template <typename Stream>
void Abandon(Stream& stream, Context& ctx) {
    try {
        stream.Close(ctx);
    } catch (const std::exception& e) {
        VLOG(1) << "Error closing abandoned stream: " << e.what();
    }
}

} // anonymous namespace

size_t BytesSource::Read(uint8_t* buffer, size_t capacity) {
    size_t n = std::min(capacity, data_.size() - offset_);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

TransferEngine::TransferEngine(StoreConnection& store, MetricsSink& metrics, size_t buffer_size)
    : store_(store), metrics_(metrics), buffer_size_(buffer_size) {
    if (buffer_size_ == 0) {
        throw ConfigurationError("transfer buffer size must be positive");
    }
}

// ============================================================================
// PUT
// ============================================================================

TransferResult TransferEngine::Put(
    Context& ctx,
    const Object& object,
    PayloadSource& payload,
    const SessionToken* token
) {
    std::unique_ptr<PutStream> stream;
    bool closed = false;
    uint64_t sent = 0;

    metrics_.Report(metrics::OBJ_PUT_TOTAL, 1);
    auto start = std::chrono::steady_clock::now();

    auto fail = [&](const Error& e) {
        if (stream && !closed) {
            Abandon(*stream, ctx);
        }
        metrics_.Report(metrics::OBJ_PUT_FAILS, 1);
        LOG(WARNING) << "PUT to " << object.Header().container.ToString() << " failed ("
                     << ErrorKindName(e.kind()) << "): " << e.what();
        TransferResult result = Failure(e);
        result.bytes = sent;
        return result;
    };

    try {
        std::vector<uint8_t> buffer(buffer_size_);

        ctx.ThrowIfCancelled("open put stream");
        stream = store_.OpenPutStream(ctx, token);
        if (!stream) {
            throw TransportError("store returned no put stream");
        }

        if (!stream->WriteHeader(ctx, object)) {
            closed = true;
            stream->Close(ctx);
            throw TransportError("object header rejected by store");
        }

        bool rejected = false;
        for (;;) {
            ctx.ThrowIfCancelled("write payload");
            size_t n = payload.Read(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            if (!stream->WriteChunk(ctx, buffer.data(), n)) {
                rejected = true;
                break;
            }
            sent += n;
        }

        ctx.ThrowIfCancelled("close put stream");
        closed = true;
        ObjectID stored = stream->Close(ctx);
        if (rejected) {
            throw TransportError("payload chunk rejected by store");
        }

        metrics_.Report(metrics::OBJ_PUT_DURATION, ElapsedMillis(start));
        metrics_.ReportDataSent(sent);
        VLOG(1) << "Stored object " << stored.ToString() << " (" << sent << " bytes)";

        TransferResult result;
        result.success = true;
        result.stored_id = std::move(stored);
        result.bytes = sent;
        return result;
    } catch (const Error& e) {
        return fail(e);
    } catch (const std::exception& e) {
        return fail(TransportError(e.what()));
    }
}

// ============================================================================
// GET
// ============================================================================

TransferResult TransferEngine::Get(
    Context& ctx,
    const ContainerID& container,
    const ObjectID& id,
    const SessionToken* token
) {
    std::unique_ptr<GetStream> stream;
    bool closed = false;
    uint64_t received = 0;

    metrics_.Report(metrics::OBJ_GET_TOTAL, 1);
    auto start = std::chrono::steady_clock::now();

    auto fail = [&](const Error& e) {
        if (stream && !closed) {
            Abandon(*stream, ctx);
        }
        metrics_.Report(metrics::OBJ_GET_FAILS, 1);
        LOG(WARNING) << "GET " << container.ToString() << "/" << id.ToString() << " failed ("
                     << ErrorKindName(e.kind()) << "): " << e.what();
        TransferResult result = Failure(e);
        result.bytes = received;
        return result;
    };

    try {
        std::vector<uint8_t> buffer(buffer_size_);

        ctx.ThrowIfCancelled("open get stream");
        stream = store_.OpenGetStream(ctx, container, id, token);
        if (!stream) {
            throw TransportError("store returned no get stream");
        }

        std::optional<Object> object = stream->ReadHeader(ctx);
        if (!object) {
            closed = true;
            stream->Close(ctx);
            throw TransportError("failed to read object header");
        }

        for (;;) {
            ctx.ThrowIfCancelled("read payload");
            size_t n = stream->ReadChunk(ctx, buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            received += n;
        }

        closed = true;
        stream->Close(ctx);

        metrics_.Report(metrics::OBJ_GET_DURATION, ElapsedMillis(start));
        metrics_.ReportDataReceived(received);
        VLOG(1) << "Read object " << container.ToString() << "/" << id.ToString() << " ("
                << received << " bytes)";

        TransferResult result;
        result.success = true;
        result.header = object->Header();
        result.bytes = received;
        return result;
    } catch (const Error& e) {
        return fail(e);
    } catch (const std::exception& e) {
        return fail(TransportError(e.what()));
    }
}

} // namespace neoload
