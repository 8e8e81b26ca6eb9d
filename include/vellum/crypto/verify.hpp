#pragma once

#include <vellum/crypto/scheme.hpp>
#include <vellum/schema/primitives.hpp>

#include <optional>

namespace vellum::crypto {

/// Both supported schemes are usable with the linked OpenSSL.
bool available();

/// Scheme of a DER SubjectPublicKeyInfo, or nullopt for anything that is not
/// an Ed25519 or secp256k1 public key.
std::optional<signature_scheme_t> scheme_of(
    const vellum::schema::bytes_view_t& der_public_key);

/// Checks a 64-byte signature over `message`. Ed25519 signs the message
/// itself; secp256k1 is ECDSA over its SHA-256 with the compact r || s
/// encoding.
bool verify_signature(const vellum::schema::bytes_view_t& message,
                      const vellum::schema::bytes_view_t& der_public_key,
                      const vellum::schema::bytes_view_t& signature);

}  // namespace vellum::crypto
