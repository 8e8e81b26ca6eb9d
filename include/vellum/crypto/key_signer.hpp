#pragma once

#include <vellum/common/error.hpp>
#include <vellum/crypto/openssl.hpp>
#include <vellum/crypto/scheme.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/schema/principal.hpp>

#include <optional>
#include <string_view>

namespace vellum::crypto {

/// One private key able to sign request ids.
///
/// Immutable once built: `sign` is const and may be called concurrently.
/// Key material is never logged and never leaves the object.
class key_signer final {
 public:
  /// PKCS#8 `PRIVATE KEY` (Ed25519 or secp256k1) or SEC1 `EC PRIVATE KEY`.
  /// Unparseable text is a "malformed key material" error; a well formed key
  /// of another algorithm is "unsupported key algorithm". With `expected`
  /// set, a key of the other scheme is rejected as well.
  static std::optional<key_signer> from_pem(
      std::string_view pem,
      vellum::common::error& error,
      std::optional<signature_scheme_t> expected = std::nullopt);

  static std::optional<key_signer> from_ed25519_seed(
      const vellum::schema::bytes_view_t& seed,
      vellum::common::error& error);

  static std::optional<key_signer> from_secp256k1_secret(
      const vellum::schema::bytes_view_t& secret,
      vellum::common::error& error);

  signature_scheme_t scheme() const { return scheme_; }

  /// DER SubjectPublicKeyInfo.
  const vellum::schema::bytes_t& public_key() const { return public_key_; }

  /// Self-authenticating principal of `public_key()`.
  const vellum::schema::principal_t& principal() const { return principal_; }

  /// Signs `"\x0Aic-request" || request_id`. The request id must be exactly
  /// 32 bytes.
  std::optional<vellum::schema::signature_t> sign(
      const vellum::schema::bytes_view_t& request_id,
      vellum::common::error& error) const;

 private:
  key_signer(evp_pkey_ptr key,
             signature_scheme_t scheme,
             vellum::schema::bytes_t public_key);

  static std::optional<key_signer> make(evp_pkey_ptr key,
                                        signature_scheme_t scheme,
                                        vellum::common::error& error);

  evp_pkey_ptr key_;
  signature_scheme_t scheme_;
  vellum::schema::bytes_t public_key_;
  vellum::schema::principal_t principal_;
};

}  // namespace vellum::crypto
