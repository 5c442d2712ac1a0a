/**
 * @file loopback_store.cpp
 * @brief In-memory store
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/client/loopback_store.h"
#include "neoload/client/network_parameters.h"
#include "neoload/common/checksum.h"
#include "neoload/common/errors.h"
#include "neoload/common/limits.h"
#include <glog/logging.h>
#include <algorithm>
#include <cstring>
#include <string>

namespace neoload {

namespace {

NetworkParameter MakeParameter(const char* key, std::vector<uint8_t> value) {
    NetworkParameter param;
    param.key.assign(key, key + std::strlen(key));
    param.value = std::move(value);
    return param;
}

std::vector<uint8_t> EncodeUint64LE(uint64_t v) {
    std::vector<uint8_t> out(limits::MAX_OBJECT_SIZE_VALUE_SIZE);
    for (size_t i = 0; i < out.size(); i++) {
        out[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    return out;
}

// The stream hashed under the mode current at header time; align with the mode at commit
PayloadChecksums AlignHashingMode(PayloadChecksums sums, const std::vector<uint8_t>& payload, bool hh_disabled) {
    if (hh_disabled) {
        sums.homomorphic.reset();
    } else if (!sums.homomorphic) {
        sums = ComputeChecksums(payload, true);
    }
    return sums;
}

void CheckPayloadChecksums(const ObjectHeader& header, const PayloadChecksums& sums, bool hh_disabled) {
    if (!header.payload_checksum || *header.payload_checksum != sums.payload) {
        throw TransportError("invalid payload checksum");
    }
    if (hh_disabled) {
        if (header.homomorphic_checksum) {
            throw TransportError("homomorphic hashing is disabled in the network");
        }
        return;
    }
    if (!header.homomorphic_checksum || *header.homomorphic_checksum != *sums.homomorphic) {
        throw TransportError("invalid homomorphic checksum");
    }
}

} // anonymous namespace

// ============================================================================
// Streams
// ============================================================================

class LoopbackStore::PutStreamImpl : public PutStream {
public:
    PutStreamImpl(LoopbackStore& store, std::optional<SessionToken> token)
        : store_(store), token_(std::move(token)) {}

    bool WriteHeader(Context& ctx, const Object& object) override {
        ctx.ThrowIfCancelled("loopback header write");
        if (header_) {
            return Reject("object header already written");
        }
        LoopbackOptions opts = store_.Snapshot();
        if (object.Header().payload_size > opts.max_object_size) {
            return Reject("payload size " + std::to_string(object.Header().payload_size) +
                          " is bigger than network limit " + std::to_string(opts.max_object_size));
        }
        header_ = object;
        checksums_ = std::make_unique<ChecksumCalculator>(!opts.homomorphic_hashing_disabled);
        return true;
    }

    bool WriteChunk(Context& ctx, const uint8_t* data, size_t size) override {
        ctx.ThrowIfCancelled("loopback chunk write");
        if (error_) {
            return false;
        }
        if (!header_) {
            return Reject("payload chunk before object header");
        }
        if (checksums_->Size() + size > header_->Header().payload_size) {
            return Reject("payload exceeds declared size " + std::to_string(header_->Header().payload_size));
        }
        checksums_->Update(data, size);
        payload_.insert(payload_.end(), data, data + size);
        return true;
    }

    ObjectID Close(Context& ctx) override {
        ctx.ThrowIfCancelled("loopback put close");
        if (error_) {
            throw TransportError(*error_);
        }
        if (!header_) {
            throw TransportError("missing object header");
        }
        uint64_t streamed = checksums_->Size();
        return store_.Commit(*header_, std::move(payload_), streamed, checksums_->Finalize(), token_);
    }

private:
    bool Reject(const std::string& reason) {
        if (!error_) {
            error_ = reason;
        }
        return false;
    }

    LoopbackStore& store_;
    std::optional<SessionToken> token_;
    std::optional<Object> header_;
    std::unique_ptr<ChecksumCalculator> checksums_;
    std::vector<uint8_t> payload_;
    std::optional<std::string> error_;
};

class LoopbackStore::GetStreamImpl : public GetStream {
public:
    GetStreamImpl(std::optional<Entry> entry, std::string error)
        : entry_(std::move(entry)), error_(std::move(error)) {}

    std::optional<Object> ReadHeader(Context& ctx) override {
        ctx.ThrowIfCancelled("loopback header read");
        if (!entry_) {
            return std::nullopt;
        }
        return entry_->object;
    }

    size_t ReadChunk(Context& ctx, uint8_t* buffer, size_t capacity) override {
        ctx.ThrowIfCancelled("loopback chunk read");
        if (!entry_) {
            throw TransportError(error_);
        }
        const auto& payload = *entry_->payload;
        size_t n = std::min(capacity, payload.size() - offset_);
        if (n > 0) {
            std::memcpy(buffer, payload.data() + offset_, n);
            offset_ += n;
        }
        return n;
    }

    void Close(Context& ctx) override {
        ctx.ThrowIfCancelled("loopback get close");
        if (!entry_) {
            throw TransportError(error_);
        }
    }

private:
    std::optional<Entry> entry_;
    std::string error_;
    size_t offset_ = 0;
};

// ============================================================================
// LoopbackStore
// ============================================================================

LoopbackStore::LoopbackStore(const LoopbackOptions& options)
    : LoopbackStore(options, crypto::PrivateKey::Generate()) {}

LoopbackStore::LoopbackStore(const LoopbackOptions& options, crypto::PrivateKey node_key)
    : node_key_(std::move(node_key)), options_(options) {}

LoopbackOptions LoopbackStore::Snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return options_;
}

void LoopbackStore::SetEpoch(uint64_t epoch) {
    std::lock_guard<std::mutex> lock(mu_);
    options_.epoch = epoch;
}

NetworkInfo LoopbackStore::QueryNetworkInfo(Context& ctx) {
    ctx.ThrowIfCancelled("loopback network info");
    LoopbackOptions opts = Snapshot();

    NetworkInfo info;
    info.current_epoch = opts.epoch;
    info.magic_number = opts.magic_number;
    info.ms_per_block = opts.ms_per_block;
    info.parameters.push_back(MakeParameter(MAX_OBJECT_SIZE_KEY, EncodeUint64LE(opts.max_object_size)));
    info.parameters.push_back(MakeParameter(
        HOMOMORPHIC_HASHING_DISABLED_KEY,
        std::vector<uint8_t>{static_cast<uint8_t>(opts.homomorphic_hashing_disabled ? 1 : 0)}));
    return info;
}

std::unique_ptr<PutStream> LoopbackStore::OpenPutStream(Context& ctx, const SessionToken* token) {
    ctx.ThrowIfCancelled("loopback put open");
    std::optional<SessionToken> copy;
    if (token) {
        copy = *token;
    }
    return std::make_unique<PutStreamImpl>(*this, std::move(copy));
}

std::unique_ptr<GetStream> LoopbackStore::OpenGetStream(
    Context& ctx,
    const ContainerID& container,
    const ObjectID& object,
    const SessionToken* token
) {
    ctx.ThrowIfCancelled("loopback get open");
    if (token) {
        try {
            VerifySessionToken(*token, ObjectVerb::Get, ObjectAddress{container, object}, Snapshot().epoch);
        } catch (const AuthorizationError& e) {
            throw TransportError(std::string("access denied: ") + e.what());
        }
    }

    std::optional<Entry> entry = Find(container, object);
    if (!entry) {
        return std::make_unique<GetStreamImpl>(std::nullopt, "object not found: " + container.ToString() + "/" +
                                                                  object.ToString());
    }
    return std::make_unique<GetStreamImpl>(std::move(entry), std::string());
}

ObjectID LoopbackStore::Commit(
    const Object& received,
    std::vector<uint8_t> payload,
    uint64_t streamed,
    PayloadChecksums sums,
    const std::optional<SessionToken>& token
) {
    const ObjectHeader& header = received.Header();
    if (streamed != header.payload_size) {
        throw TransportError("header declares " + std::to_string(header.payload_size) +
                             " payload bytes, received " + std::to_string(streamed));
    }
    if (header.container.IsEmpty()) {
        throw TransportError("object has no container");
    }

    LoopbackOptions opts = Snapshot();
    sums = AlignHashingMode(std::move(sums), payload, opts.homomorphic_hashing_disabled);
    Object stored;
    try {
        if (received.HasIdentity()) {
            if (token) {
                VerifySessionToken(*token, ObjectVerb::Put, ObjectAddress{header.container, std::nullopt}, opts.epoch);
            }
            VerifyObject(received);
            CheckPayloadChecksums(header, sums, opts.homomorphic_hashing_disabled);
            stored = received;
        } else {
            if (!token) {
                throw TransportError("object without identity requires a session token");
            }
            VerifySessionToken(*token, ObjectVerb::Put, ObjectAddress{header.container, std::nullopt}, opts.epoch);
            if (header.owner != token->Issuer()) {
                throw TransportError("object owner differs from session token issuer");
            }

            ObjectHeader completed = ObjectBuilder::BuildHeader(
                header.container, header.owner, payload.size(), opts.epoch, sums.payload, sums.homomorphic);
            completed.session_token = *token;
            stored = ObjectBuilder(node_key_).Finalize(completed, header.attributes);
        }
    } catch (const TransportError&) {
        throw;
    } catch (const Error& e) {
        throw TransportError(std::string("object rejected: ") + e.what());
    }

    ObjectID id = *stored.ID();
    {
        std::lock_guard<std::mutex> lock(mu_);
        objects_[{header.container, id}] =
            Entry{std::move(stored), std::make_shared<const std::vector<uint8_t>>(std::move(payload))};
    }
    VLOG(1) << "Loopback stored " << header.container.ToString() << "/" << id.ToString();
    return id;
}

std::optional<LoopbackStore::Entry> LoopbackStore::Find(const ContainerID& container, const ObjectID& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = objects_.find({container, id});
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t LoopbackStore::ObjectCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    return objects_.size();
}

std::optional<Object> LoopbackStore::HeadObject(const ContainerID& container, const ObjectID& id) const {
    auto entry = Find(container, id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->object;
}

std::optional<std::vector<uint8_t>> LoopbackStore::Payload(const ContainerID& container, const ObjectID& id) const {
    auto entry = Find(container, id);
    if (!entry) {
        return std::nullopt;
    }
    return *entry->payload;
}

} // namespace neoload
