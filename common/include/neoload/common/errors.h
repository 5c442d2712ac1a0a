/**
 * @file errors.h
 * @brief Error taxonomy for object preparation and transfer
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_ERRORS_H
#define NEOLOAD_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace neoload {

/**
 * @brief Classification carried by every failure
 *
 * Transfer results expose the kind so a load-generating caller can tally
 * outcomes without inspecting message text.
 */
enum class ErrorKind {
    None = 0,
    Configuration,
    Authorization,
    ParameterResolution,
    PayloadTooLarge,
    IdentityComputation,
    Signature,
    Transport,
    Cancelled
};

/**
 * @brief Human-readable name of an error kind ("transport", "cancelled", ...)
 */
const char* ErrorKindName(ErrorKind kind);

/**
 * @brief Base class of all neoload errors
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Bad caller-supplied setting or identifier (buffer size, Base58 IDs)
 */
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message)
        : Error(ErrorKind::Configuration, message) {}
};

/**
 * @brief Session token scoping or signing failed
 */
class AuthorizationError : public Error {
public:
    explicit AuthorizationError(const std::string& message)
        : Error(ErrorKind::Authorization, message) {}
};

/**
 * @brief Network parameters could not be resolved
 */
class ParameterResolutionError : public Error {
public:
    explicit ParameterResolutionError(const std::string& message)
        : Error(ErrorKind::ParameterResolution, message) {}
};

class MissingRequiredParameter : public ParameterResolutionError {
public:
    explicit MissingRequiredParameter(const std::string& key)
        : ParameterResolutionError("network configuration misses " + key + " value"), key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class MalformedParameter : public ParameterResolutionError {
public:
    MalformedParameter(const std::string& key, const std::string& reason)
        : ParameterResolutionError("invalid " + key + " parameter: " + reason), key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/**
 * @brief Payload exceeds the network's maximum object size
 */
class PayloadTooLarge : public Error {
public:
    PayloadTooLarge(uint64_t size, uint64_t limit)
        : Error(ErrorKind::PayloadTooLarge,
                "payload size " + std::to_string(size) + " is bigger than network limit " +
                    std::to_string(limit)),
          size_(size), limit_(limit) {}

    uint64_t size() const noexcept { return size_; }
    uint64_t limit() const noexcept { return limit_; }

private:
    uint64_t size_;
    uint64_t limit_;
};

/**
 * @brief Canonical encoding or hashing of an object header failed
 */
class IdentityComputationError : public Error {
public:
    explicit IdentityComputationError(const std::string& message)
        : Error(ErrorKind::IdentityComputation, message) {}
};

/**
 * @brief Signing an object identifier failed (bad key material)
 */
class SignatureError : public Error {
public:
    explicit SignatureError(const std::string& message)
        : Error(ErrorKind::Signature, message) {}
};

/**
 * @brief Stream open/write/read/close failure reported by the store
 */
class TransportError : public Error {
public:
    explicit TransportError(const std::string& message)
        : Error(ErrorKind::Transport, message) {}
};

/**
 * @brief Operation aborted through its context
 */
class CancellationError : public Error {
public:
    explicit CancellationError(const std::string& message = "operation cancelled")
        : Error(ErrorKind::Cancelled, message) {}
};

} // namespace neoload

#endif // NEOLOAD_ERRORS_H
