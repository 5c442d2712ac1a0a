/**
 * @file loopback_store.h
 * @brief In-memory store that validates objects the way a storage node does
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_LOOPBACK_STORE_H
#define NEOLOAD_LOOPBACK_STORE_H

#include "neoload/client/store.h"
#include "neoload/common/checksum.h"
#include "neoload/common/crypto.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace neoload {

struct LoopbackOptions {
    uint64_t max_object_size = 64 * 1024 * 1024;
    uint64_t epoch = 1;
    bool homomorphic_hashing_disabled = false;
    uint64_t magic_number = 0;
    int64_t ms_per_block = 1000;
};

/**
 * @brief StoreConnection backed by process memory
 *
 * Objects signed by the client are checked for identity, signature and
 * checksums. Delegated objects must arrive under a valid PUT session token
 * issued by the object owner; the store then completes the header and signs
 * it with its own node key. GET requests carrying a token are checked
 * against it. Thread-safe.
 */
class LoopbackStore : public StoreConnection {
public:
    /**
     * @brief Store with a freshly generated node key
     */
    explicit LoopbackStore(const LoopbackOptions& options);

    LoopbackStore(const LoopbackOptions& options, crypto::PrivateKey node_key);

    NetworkInfo QueryNetworkInfo(Context& ctx) override;
    std::unique_ptr<PutStream> OpenPutStream(Context& ctx, const SessionToken* token) override;
    std::unique_ptr<GetStream> OpenGetStream(
        Context& ctx,
        const ContainerID& container,
        const ObjectID& object,
        const SessionToken* token
    ) override;

    /**
     * @brief Advance the network epoch
     */
    void SetEpoch(uint64_t epoch);

    size_t ObjectCount() const;

    /**
     * @return Stored header, or nullopt if no such object
     */
    std::optional<Object> HeadObject(const ContainerID& container, const ObjectID& id) const;

    /**
     * @return Stored payload, or nullopt if no such object
     */
    std::optional<std::vector<uint8_t>> Payload(const ContainerID& container, const ObjectID& id) const;

private:
    class PutStreamImpl;
    class GetStreamImpl;

    struct Entry {
        Object object;
        std::shared_ptr<const std::vector<uint8_t>> payload;
    };

    ObjectID Commit(
        const Object& received,
        std::vector<uint8_t> payload,
        uint64_t streamed,
        PayloadChecksums sums,
        const std::optional<SessionToken>& token);
    std::optional<Entry> Find(const ContainerID& container, const ObjectID& id) const;
    LoopbackOptions Snapshot() const;

    crypto::PrivateKey node_key_;

    mutable std::mutex mu_;
    LoopbackOptions options_;
    std::map<std::pair<ContainerID, ObjectID>, Entry> objects_;
};

} // namespace neoload

#endif // NEOLOAD_LOOPBACK_STORE_H
