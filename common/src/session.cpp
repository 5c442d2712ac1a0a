/**
 * @file session.cpp
 * @brief Session token templates, scoping and verification
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/common/session.h"
#include "neoload/common/crypto.h"
#include "neoload/common/errors.h"
#include "neoload/common/limits.h"
#include "proto_convert.h"
#include "session.pb.h"
#include <glog/logging.h>
#include <algorithm>

namespace neoload {

const char* ObjectVerbName(ObjectVerb verb) {
    switch (verb) {
        case ObjectVerb::Put: return "PUT";
        case ObjectVerb::Get: return "GET";
        case ObjectVerb::Head: return "HEAD";
        case ObjectVerb::Search: return "SEARCH";
        case ObjectVerb::Delete: return "DELETE";
        case ObjectVerb::Range: return "RANGE";
        case ObjectVerb::RangeHash: return "RANGEHASH";
        default: return "UNSPECIFIED";
    }
}

// ============================================================================
// SessionToken
// ============================================================================

SessionToken SessionToken::CreateTemplate(
    const crypto::PrivateKey& issuer_key,
    const std::vector<uint8_t>& session_key,
    const TokenLifetime& lifetime
) {
    if (session_key.size() != crypto::P256_COMPRESSED_KEY_SIZE) {
        throw AuthorizationError("session key must be a 33-byte compressed public key");
    }

    SessionToken token;
    token.id_ = crypto::RandomBytes(limits::SESSION_ID_SIZE);
    // RFC 4122 version 4 UUID
    token.id_[6] = static_cast<uint8_t>((token.id_[6] & 0x0F) | 0x40);
    token.id_[8] = static_cast<uint8_t>((token.id_[8] & 0x3F) | 0x80);

    try {
        token.issuer_ = OwnerID::FromPublicKey(crypto::PublicKey::FromPrivateKey(issuer_key));
    } catch (const crypto::CryptoError& e) {
        throw AuthorizationError(std::string("failed to derive token issuer: ") + e.what());
    }

    token.lifetime_ = lifetime;
    token.session_key_ = session_key;
    return token;
}

std::vector<uint8_t> SessionToken::MarshalBody() const {
    ::neoload::proto::SessionToken message;
    internal::ToProto(*this, &message);

    std::vector<uint8_t> out;
    if (!internal::SerializeDeterministic(message.body(), &out)) {
        throw AuthorizationError("failed to encode session token body");
    }
    return out;
}

std::vector<uint8_t> SessionToken::Marshal() const {
    ::neoload::proto::SessionToken message;
    internal::ToProto(*this, &message);

    std::vector<uint8_t> out;
    if (!internal::SerializeDeterministic(message, &out)) {
        throw AuthorizationError("failed to encode session token");
    }
    return out;
}

bool SessionToken::AppliesTo(ObjectVerb verb, const ObjectAddress& address) const {
    if (verb_ != verb || container_ != address.container) {
        return false;
    }
    if (objects_.empty()) {
        return true;
    }
    if (!address.object) {
        return false;
    }
    return std::find(objects_.begin(), objects_.end(), *address.object) != objects_.end();
}

bool SessionToken::ValidAt(uint64_t epoch) const {
    return lifetime_.not_before <= epoch && epoch <= lifetime_.expiration &&
           lifetime_.issued_at <= epoch;
}

bool SessionToken::VerifySignature() const {
    if (!signature_) {
        return false;
    }

    // The signer must be the declared issuer
    try {
        auto signer = OwnerID::FromPublicKey(crypto::PublicKey::FromBytes(signature_->key));
        if (signer != issuer_) {
            return false;
        }
    } catch (const crypto::CryptoError& e) {
        VLOG(1) << "Session token signer key rejected: " << e.what();
        return false;
    }

    return VerifyData(*signature_, MarshalBody());
}

// ============================================================================
// SessionAuthorizer
// ============================================================================

SessionAuthorizer::SessionAuthorizer(const crypto::PrivateKey& signing_key)
    : signing_key_(signing_key) {}

SessionToken SessionAuthorizer::Scope(
    const SessionToken& base,
    ObjectVerb verb,
    const ObjectAddress& target
) const {
    if (verb == ObjectVerb::Unspecified) {
        throw AuthorizationError("session token verb is not specified");
    }
    if (target.container.IsEmpty()) {
        throw AuthorizationError("session token target has no container");
    }

    SessionToken token = base;
    token.verb_ = verb;
    token.container_ = target.container;
    token.objects_.clear();
    if (target.object) {
        token.objects_.push_back(*target.object);
    }
    token.signature_.reset();

    try {
        token.issuer_ = OwnerID::FromPublicKey(crypto::PublicKey::FromPrivateKey(signing_key_));
        token.signature_ = SignData(signing_key_, token.MarshalBody());
    } catch (const crypto::CryptoError& e) {
        throw AuthorizationError(std::string("failed to sign session token: ") + e.what());
    }

    return token;
}

// ============================================================================
// Verification
// ============================================================================

void VerifySessionToken(
    const SessionToken& token,
    ObjectVerb verb,
    const ObjectAddress& address,
    uint64_t current_epoch
) {
    if (!token.VerifySignature()) {
        throw AuthorizationError("invalid session token signature");
    }
    if (token.Verb() != verb) {
        throw AuthorizationError(std::string("session token is issued for ") +
                                 ObjectVerbName(token.Verb()) + ", not " + ObjectVerbName(verb));
    }
    if (!token.AppliesTo(verb, address)) {
        throw AuthorizationError("session token does not apply to " + address.ToString());
    }
    if (!token.ValidAt(current_epoch)) {
        throw AuthorizationError("session token is not valid at epoch " + std::to_string(current_epoch));
    }
}

} // namespace neoload
