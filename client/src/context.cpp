/**
 * @file context.cpp
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/client/context.h"
#include "neoload/common/errors.h"
#include <string>

namespace neoload {

void Context::ThrowIfCancelled(const char* stage) const {
    if (IsCancelled()) {
        throw CancellationError(std::string("operation cancelled: ") + stage);
    }
}

} // namespace neoload
