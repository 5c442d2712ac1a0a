/**
 * @file errors.cpp
 * @brief Error kind names
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/common/errors.h"

namespace neoload {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Authorization: return "authorization";
        case ErrorKind::ParameterResolution: return "parameter_resolution";
        case ErrorKind::PayloadTooLarge: return "payload_too_large";
        case ErrorKind::IdentityComputation: return "identity_computation";
        case ErrorKind::Signature: return "signature";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace neoload
