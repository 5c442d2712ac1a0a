/**
 * @file network_parameters.cpp
 * @brief Network parameter decoding
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/client/network_parameters.h"
#include "neoload/common/errors.h"
#include "neoload/common/limits.h"
#include <glog/logging.h>
#include <algorithm>
#include <cstring>

namespace neoload {

namespace {

bool KeyEquals(const std::vector<uint8_t>& key, const char* name) {
    size_t len = std::strlen(name);
    return key.size() == len && std::equal(key.begin(), key.end(), name);
}

uint64_t DecodeUint64LE(const std::vector<uint8_t>& value) {
    uint64_t result = 0;
    size_t n = std::min(value.size(), limits::MAX_OBJECT_SIZE_VALUE_SIZE);
    for (size_t i = 0; i < n; i++) {
        result |= static_cast<uint64_t>(value[i]) << (8 * i);
    }
    return result;
}

bool DecodeBool(const std::vector<uint8_t>& value) {
    if (value.size() > limits::MAX_BOOL_PARAMETER_SIZE) {
        throw MalformedParameter(HOMOMORPHIC_HASHING_DISABLED_KEY,
                                 "value of " + std::to_string(value.size()) + " bytes is too long");
    }
    return std::any_of(value.begin(), value.end(), [](uint8_t b) { return b != 0; });
}

} // anonymous namespace

NetworkParameterResolver::NetworkParameterResolver(StoreConnection& store)
    : store_(store) {}

NetworkParameters NetworkParameterResolver::Resolve(Context& ctx) const {
    ctx.ThrowIfCancelled("network info");
    return Parse(store_.QueryNetworkInfo(ctx));
}

NetworkParameters NetworkParameterResolver::Parse(const NetworkInfo& info) {
    NetworkParameters params;
    params.current_epoch = info.current_epoch;

    bool have_max_size = false;
    for (const auto& param : info.parameters) {
        if (KeyEquals(param.key, MAX_OBJECT_SIZE_KEY)) {
            params.max_object_size = DecodeUint64LE(param.value);
            have_max_size = true;
        } else if (KeyEquals(param.key, HOMOMORPHIC_HASHING_DISABLED_KEY)) {
            params.homomorphic_hashing_disabled = DecodeBool(param.value);
        }
    }

    if (!have_max_size) {
        throw MissingRequiredParameter(MAX_OBJECT_SIZE_KEY);
    }

    VLOG(1) << "Network parameters: epoch=" << params.current_epoch
            << " max_object_size=" << params.max_object_size
            << " homomorphic_hashing_disabled=" << params.homomorphic_hashing_disabled;
    return params;
}

} // namespace neoload
