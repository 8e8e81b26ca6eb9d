#include <vellum/crypto/openssl.hpp>
#include <vellum/crypto/verify.hpp>

#include <openssl/core_names.h>
#include <openssl/x509.h>

#include <vector>

namespace vellum::crypto {

namespace {

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool openssl_has_secp256k1() {
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  return static_cast<bool>(group);
}

/// Parses a DER public key, requiring the whole input to be consumed.
evp_pkey_ptr parse_public_key(const vellum::schema::bytes_view_t& der) {
  const auto* cursor = der.data();
  auto pkey = evp_pkey_ptr{
      d2i_PUBKEY(nullptr, &cursor, static_cast<long>(der.size())),
      EVP_PKEY_free};
  if (pkey && cursor != der.data() + der.size()) {
    pkey.reset();
  }
  ERR_clear_error();
  return pkey;
}

bool verify_ed25519(const vellum::schema::bytes_view_t& message,
                    EVP_PKEY* pkey,
                    const vellum::schema::bytes_view_t& signature) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey) == 1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

bool verify_secp256k1(const vellum::schema::bytes_view_t& message,
                      EVP_PKEY* pkey,
                      const vellum::schema::bytes_view_t& signature) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }

  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return false;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

}  // namespace

std::optional<signature_scheme_t> key_scheme(const EVP_PKEY* pkey) {
  if (EVP_PKEY_get_base_id(pkey) == EVP_PKEY_ED25519) {
    return signature_scheme_t::ed25519;
  }
  if (EVP_PKEY_get_base_id(pkey) == EVP_PKEY_EC) {
    auto name = std::array<char, 64>{};
    auto length = std::size_t{0};
    if (EVP_PKEY_get_group_name(pkey, name.data(), name.size(), &length) ==
            1 &&
        std::string_view{name.data(), length} == "secp256k1") {
      return signature_scheme_t::secp256k1;
    }
  }
  return std::nullopt;
}

bool available() {
  static const auto available_now =
      openssl_has_ed25519() && openssl_has_secp256k1();
  return available_now;
}

std::optional<signature_scheme_t> scheme_of(
    const vellum::schema::bytes_view_t& der_public_key) {
  auto pkey = parse_public_key(der_public_key);
  if (!pkey) {
    return std::nullopt;
  }
  return key_scheme(pkey.get());
}

bool verify_signature(const vellum::schema::bytes_view_t& message,
                      const vellum::schema::bytes_view_t& der_public_key,
                      const vellum::schema::bytes_view_t& signature) {
  if (signature.size() != 64) {
    return false;
  }
  auto pkey = parse_public_key(der_public_key);
  if (!pkey) {
    return false;
  }
  auto scheme = key_scheme(pkey.get());
  if (!scheme) {
    return false;
  }

  auto verified = false;
  switch (*scheme) {
    case signature_scheme_t::ed25519:
      verified = verify_ed25519(message, pkey.get(), signature);
      break;
    case signature_scheme_t::secp256k1:
      verified = verify_secp256k1(message, pkey.get(), signature);
      break;
  }
  ERR_clear_error();
  return verified;
}

}  // namespace vellum::crypto
