#include <vellum/common/critical.hpp>
#include <vellum/crypto/key_signer.hpp>
#include <vellum/request/request_id.hpp>

#include <openssl/core_names.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace vellum::crypto {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.crypto"};
constexpr auto kKeySize = std::size_t{32};

std::nullopt_t fail_key(vellum::common::error& error,
                        const std::string_view log,
                        std::string info) {
  vellum::common::fail(error, vellum::common::error_code::key,
                       std::string{log}, std::move(info), kCodespace);
  return std::nullopt;
}

std::string describe_algorithm(const EVP_PKEY* pkey) {
  const auto* name = EVP_PKEY_get0_type_name(pkey);
  auto text = std::string{name != nullptr ? name : "unknown"};
  if (EVP_PKEY_get_base_id(pkey) == EVP_PKEY_EC) {
    auto group = std::array<char, 64>{};
    auto length = std::size_t{0};
    if (EVP_PKEY_get_group_name(pkey, group.data(), group.size(), &length) ==
        1) {
      text += " " + std::string{group.data(), length};
    }
  }
  return text;
}

// Encrypted keys are not supported; never prompt for a passphrase.
int refuse_passphrase(char*, int, int, void*) {
  return 0;
}

vellum::schema::signature_t sign_ed25519(EVP_PKEY* key,
                                         const vellum::schema::bytes_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto signature = vellum::schema::signature_t{};
  auto length = signature.size();
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key) != 1 ||
      EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    vellum::common::critical("Ed25519 signing failed");
  }
  return signature;
}

vellum::schema::signature_t sign_secp256k1(
    EVP_PKEY* key,
    const vellum::schema::bytes_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto length = std::size_t{0};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) !=
          1 ||
      EVP_DigestSign(ctx.get(), nullptr, &length, message.data(),
                     message.size()) != 1) {
    vellum::common::critical("secp256k1 signing failed");
  }
  auto der = std::vector<uint8_t>(length);
  if (EVP_DigestSign(ctx.get(), der.data(), &length, message.data(),
                     message.size()) != 1) {
    vellum::common::critical("secp256k1 signing failed");
  }

  const auto* cursor = der.data();
  auto ecdsa_sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(length)),
      ECDSA_SIG_free};
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  if (!ecdsa_sig || !group) {
    vellum::common::critical("secp256k1 signature decoding failed");
  }

  const auto* r = ECDSA_SIG_get0_r(ecdsa_sig.get());
  const auto* s = ECDSA_SIG_get0_s(ecdsa_sig.get());
  const auto* order = EC_GROUP_get0_order(group.get());
  auto half_order = bignum_ptr{BN_dup(order), BN_free};
  auto low_s = bignum_ptr{BN_dup(s), BN_free};
  if (!half_order || !low_s || BN_rshift1(half_order.get(), order) != 1) {
    vellum::common::critical("secp256k1 signature normalization failed");
  }
  // Only low-S signatures are accepted by the verifier side.
  if (BN_cmp(low_s.get(), half_order.get()) > 0 &&
      BN_sub(low_s.get(), order, s) != 1) {
    vellum::common::critical("secp256k1 signature normalization failed");
  }

  auto signature = vellum::schema::signature_t{};
  if (BN_bn2binpad(r, signature.data(), 32) != 32 ||
      BN_bn2binpad(low_s.get(), signature.data() + 32, 32) != 32) {
    vellum::common::critical("secp256k1 signature encoding failed");
  }
  return signature;
}

}  // namespace

key_signer::key_signer(evp_pkey_ptr key,
                       const signature_scheme_t scheme,
                       vellum::schema::bytes_t public_key)
    : key_{std::move(key)},
      scheme_{scheme},
      public_key_{std::move(public_key)},
      principal_{vellum::schema::make_self_authenticating_principal(
          public_key_)} {}

std::optional<key_signer> key_signer::make(evp_pkey_ptr key,
                                           const signature_scheme_t scheme,
                                           vellum::common::error& error) {
  if (scheme == signature_scheme_t::secp256k1 &&
      EVP_PKEY_set_utf8_string_param(
          key.get(), OSSL_PKEY_PARAM_EC_POINT_CONVERSION_FORMAT,
          "uncompressed") != 1) {
    return fail_key(error, "cannot export secp256k1 public key",
                    take_openssl_error());
  }
  auto length = i2d_PUBKEY(key.get(), nullptr);
  if (length <= 0) {
    return fail_key(error, "cannot export public key", take_openssl_error());
  }
  auto der = vellum::schema::bytes_t(static_cast<std::size_t>(length));
  auto* cursor = der.data();
  if (i2d_PUBKEY(key.get(), &cursor) != length) {
    return fail_key(error, "cannot export public key", take_openssl_error());
  }
  auto signer = key_signer{std::move(key), scheme, std::move(der)};
  spdlog::debug("Loaded {} key for {}", to_string(scheme),
                vellum::schema::to_text(signer.principal()));
  return signer;
}

std::optional<key_signer> key_signer::from_pem(
    const std::string_view pem,
    vellum::common::error& error,
    const std::optional<signature_scheme_t> expected) {
  auto bio = bio_ptr{BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())),
                     BIO_free};
  if (!bio) {
    vellum::common::critical("failed to allocate BIO");
  }
  auto key = evp_pkey_ptr{
      PEM_read_bio_PrivateKey(bio.get(), nullptr, refuse_passphrase, nullptr),
      EVP_PKEY_free};
  if (!key) {
    return fail_key(error, "malformed key material", take_openssl_error());
  }

  auto scheme = key_scheme(key.get());
  if (!scheme) {
    return fail_key(error, "unsupported key algorithm",
                    describe_algorithm(key.get()));
  }
  if (expected && *expected != *scheme) {
    return fail_key(error, "key scheme does not match the expected scheme",
                    std::string{to_string(*scheme)});
  }
  return make(std::move(key), *scheme, error);
}

std::optional<key_signer> key_signer::from_ed25519_seed(
    const vellum::schema::bytes_view_t& seed,
    vellum::common::error& error) {
  if (seed.size() != kKeySize) {
    return fail_key(error, "malformed key material",
                    "Ed25519 seed must be 32 bytes, got " +
                        std::to_string(seed.size()));
  }
  auto key = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(),
                                   seed.size()),
      EVP_PKEY_free};
  if (!key) {
    return fail_key(error, "malformed key material", take_openssl_error());
  }
  return make(std::move(key), signature_scheme_t::ed25519, error);
}

std::optional<key_signer> key_signer::from_secp256k1_secret(
    const vellum::schema::bytes_view_t& secret,
    vellum::common::error& error) {
  if (secret.size() != kKeySize) {
    return fail_key(error, "malformed key material",
                    "secp256k1 secret must be 32 bytes, got " +
                        std::to_string(secret.size()));
  }
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  if (!group) {
    vellum::common::critical("secp256k1 is not available in OpenSSL");
  }
  auto priv = bignum_ptr{
      BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr),
      BN_free};
  if (!priv) {
    vellum::common::critical("failed to allocate BIGNUM");
  }
  if (BN_is_zero(priv.get()) ||
      BN_cmp(priv.get(), EC_GROUP_get0_order(group.get())) >= 0) {
    return fail_key(error, "malformed key material",
                    "secp256k1 secret is outside the curve order");
  }

  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  auto public_point = vellum::schema::bytes_t(65);
  if (!point ||
      EC_POINT_mul(group.get(), point.get(), priv.get(), nullptr, nullptr,
                   nullptr) != 1 ||
      EC_POINT_point2oct(group.get(), point.get(),
                         POINT_CONVERSION_UNCOMPRESSED, public_point.data(),
                         public_point.size(), nullptr) != public_point.size()) {
    vellum::common::critical("secp256k1 public key derivation failed");
  }

  auto builder = ossl_param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!builder ||
      OSSL_PARAM_BLD_push_utf8_string(builder.get(),
                                      OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1",
                                      0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             priv.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_point.data(),
                                       public_point.size()) != 1) {
    vellum::common::critical("failed to build secp256k1 key parameters");
  }
  auto params =
      ossl_param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    vellum::common::critical("failed to build secp256k1 key parameters");
  }
  auto* raw_key = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw_key, EVP_PKEY_KEYPAIR, params.get()) !=
      1) {
    return fail_key(error, "malformed key material", take_openssl_error());
  }
  return make(evp_pkey_ptr{raw_key, EVP_PKEY_free},
               signature_scheme_t::secp256k1, error);
}

std::optional<vellum::schema::signature_t> key_signer::sign(
    const vellum::schema::bytes_view_t& request_id,
    vellum::common::error& error) const {
  if (request_id.size() != std::tuple_size_v<vellum::schema::request_id_t>) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "request id must be 32 bytes",
                         std::to_string(request_id.size()), kCodespace);
    return std::nullopt;
  }
  auto id = vellum::schema::request_id_t{};
  std::copy_n(request_id.data(), id.size(), id.data());
  auto message = vellum::request::make_signable(id);

  switch (scheme_) {
    case signature_scheme_t::ed25519:
      return sign_ed25519(key_.get(), message);
    case signature_scheme_t::secp256k1:
      return sign_secp256k1(key_.get(), message);
  }
  vellum::common::critical("unknown signature scheme");
}

}  // namespace vellum::crypto
