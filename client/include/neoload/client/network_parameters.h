/**
 * @file network_parameters.h
 * @brief Network-wide settings that govern object construction
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_NETWORK_PARAMETERS_H
#define NEOLOAD_NETWORK_PARAMETERS_H

#include "neoload/client/context.h"
#include "neoload/client/store.h"
#include <cstdint>

namespace neoload {

/// Configuration key of the object size limit
constexpr const char* MAX_OBJECT_SIZE_KEY = "MaxObjectSize";
/// Configuration key of the homomorphic hashing switch
constexpr const char* HOMOMORPHIC_HASHING_DISABLED_KEY = "HomomorphicHashingDisabled";

struct NetworkParameters {
    uint64_t max_object_size = 0;
    uint64_t current_epoch = 0;
    bool homomorphic_hashing_disabled = false;
};

/**
 * @brief Fetches and decodes network parameters
 *
 * Parameters are queried fresh on every Resolve(); nothing is cached.
 */
class NetworkParameterResolver {
public:
    explicit NetworkParameterResolver(StoreConnection& store);

    /**
     * @brief Query the store and decode the response
     * @throws MissingRequiredParameter if MaxObjectSize is absent
     * @throws MalformedParameter on an undecodable value
     * @throws TransportError, CancellationError from the store
     */
    NetworkParameters Resolve(Context& ctx) const;

    /**
     * @brief Decode a network information response
     *
     * MaxObjectSize is an unsigned little-endian integer, zero-padded or
     * truncated to 8 bytes. HomomorphicHashingDisabled defaults to false and
     * is true iff any byte of its value is non-zero.
     */
    static NetworkParameters Parse(const NetworkInfo& info);

private:
    StoreConnection& store_;
};

} // namespace neoload

#endif // NEOLOAD_NETWORK_PARAMETERS_H
