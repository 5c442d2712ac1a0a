/**
 * @file session.h
 * @brief Object session tokens and their per-operation scoping
 *
 * A session token binds a session public key to exactly one verb and one
 * target address. Tokens are derived from a long-lived template right
 * before each operation and never reused for another verb or address.
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_SESSION_H
#define NEOLOAD_SESSION_H

#include "neoload/common/ids.h"
#include "neoload/common/signature.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace neoload {

namespace crypto {
class PrivateKey;
}

/**
 * @brief Object operation a token authorizes, numbered as on the wire
 */
enum class ObjectVerb {
    Unspecified = 0,
    Put = 1,
    Get = 2,
    Head = 3,
    Search = 4,
    Delete = 5,
    Range = 6,
    RangeHash = 7
};

const char* ObjectVerbName(ObjectVerb verb);

/**
 * @brief Validity window in epochs
 */
struct TokenLifetime {
    uint64_t expiration = 0;   ///< Last epoch the token is valid in
    uint64_t not_before = 0;   ///< First epoch the token is valid in
    uint64_t issued_at = 0;
};

class SessionToken {
public:
    SessionToken() = default;

    /**
     * @brief Create an unscoped, unsigned base template
     *
     * @param issuer_key Key of the acting identity (issuer is derived from it)
     * @param session_key 33-byte compressed public key the session is opened for
     * @param lifetime Validity window
     * @throws AuthorizationError if the session key is malformed
     * @throws crypto::CryptoError if no randomness is available
     */
    static SessionToken CreateTemplate(
        const crypto::PrivateKey& issuer_key,
        const std::vector<uint8_t>& session_key,
        const TokenLifetime& lifetime
    );

    const std::vector<uint8_t>& ID() const { return id_; }
    const OwnerID& Issuer() const { return issuer_; }
    const TokenLifetime& Lifetime() const { return lifetime_; }
    const std::vector<uint8_t>& SessionKey() const { return session_key_; }
    ObjectVerb Verb() const { return verb_; }
    const ContainerID& Container() const { return container_; }
    const std::vector<ObjectID>& Objects() const { return objects_; }
    const std::optional<Signature>& GetSignature() const { return signature_; }

    /**
     * @brief Canonical encoding of the token body (what the issuer signs)
     */
    std::vector<uint8_t> MarshalBody() const;

    /**
     * @brief Canonical encoding of the whole token
     */
    std::vector<uint8_t> Marshal() const;

    /**
     * @brief Whether the bound verb and target cover an operation
     *
     * A token listing no objects covers every object in its container.
     */
    bool AppliesTo(ObjectVerb verb, const ObjectAddress& address) const;

    /**
     * @brief Whether epoch lies within the lifetime window
     */
    bool ValidAt(uint64_t epoch) const;

    /**
     * @brief Check issuer signature over the body and that the signing key
     *        belongs to the issuer
     */
    bool VerifySignature() const;

private:
    friend class SessionAuthorizer;

    std::vector<uint8_t> id_;
    OwnerID issuer_;
    TokenLifetime lifetime_;
    std::vector<uint8_t> session_key_;
    ObjectVerb verb_ = ObjectVerb::Unspecified;
    ContainerID container_;
    std::vector<ObjectID> objects_;
    std::optional<Signature> signature_;
};

/**
 * @brief Derives operation-scoped tokens from a base template
 *
 * Holds a reference to the signing key; the key must outlive the authorizer.
 * Scope() is const and safe to call from concurrent invocations.
 */
class SessionAuthorizer {
public:
    explicit SessionAuthorizer(const crypto::PrivateKey& signing_key);

    /**
     * @brief Copy base, bind it to verb and target, and sign the binding
     *
     * @param base Long-lived template (not modified)
     * @param verb Operation about to be performed
     * @param target Container, plus object for per-object operations
     * @return Signed token valid only for (verb, target)
     * @throws AuthorizationError if signing fails
     */
    SessionToken Scope(
        const SessionToken& base,
        ObjectVerb verb,
        const ObjectAddress& target
    ) const;

private:
    const crypto::PrivateKey& signing_key_;
};

/**
 * @brief Check a presented token the way the store does
 *
 * @throws AuthorizationError naming the first failed check (signature,
 *         verb, target, lifetime)
 */
void VerifySessionToken(
    const SessionToken& token,
    ObjectVerb verb,
    const ObjectAddress& address,
    uint64_t current_epoch
);

} // namespace neoload

#endif // NEOLOAD_SESSION_H
