#include <gtest/gtest.h>
#include <vellum/crypto/verify.hpp>
#include <vellum/request/request_id.hpp>
#include <vellum/testing/fixtures.hpp>

namespace {

constexpr auto kP256PublicKeyDer = std::string_view{
    "3059301306072a8648ce3d020106082a8648ce3d03010703420004b292b048043a0966"
    "2720721224acd9c0d27cf00c3293f992885b9dd6607c209d28c60dac0759e36a971353"
    "a1e320aa3f2be4c1d97789c4e0ed62b19ace8f2c79"};

vellum::schema::bytes_t golden_signable() {
  auto id = vellum::schema::try_make_hash32(vellum::testing::kGoldenRequestId);
  EXPECT_TRUE(id.has_value());
  return vellum::request::make_signable(
      id.value_or(vellum::schema::request_id_t{}));
}

}  // namespace

TEST(verify, both_schemes_are_available) {
  EXPECT_TRUE(vellum::crypto::available());
}

TEST(verify, scheme_of_public_keys) {
  EXPECT_EQ(vellum::crypto::scheme_of(
                vellum::testing::hex(vellum::testing::kEd25519PublicKeyDer)),
            std::optional{vellum::crypto::signature_scheme_t::ed25519});
  EXPECT_EQ(vellum::crypto::scheme_of(
                vellum::testing::hex(vellum::testing::kSecp256k1PublicKeyDer)),
            std::optional{vellum::crypto::signature_scheme_t::secp256k1});
  EXPECT_FALSE(
      vellum::crypto::scheme_of(vellum::testing::hex(kP256PublicKeyDer)));
  EXPECT_FALSE(vellum::crypto::scheme_of(vellum::schema::bytes_t{}));

  // Trailing bytes after the key are not a key.
  auto padded = vellum::testing::hex(vellum::testing::kEd25519PublicKeyDer);
  padded.push_back(0);
  EXPECT_FALSE(vellum::crypto::scheme_of(padded));
}

TEST(verify, golden_ed25519_signature) {
  const auto public_key =
      vellum::testing::hex(vellum::testing::kEd25519PublicKeyDer);
  auto signature = vellum::testing::hex(vellum::testing::kGoldenSignature);
  EXPECT_TRUE(vellum::crypto::verify_signature(golden_signable(), public_key,
                                               signature));

  auto message = golden_signable();
  message.back() ^= 1;
  EXPECT_FALSE(
      vellum::crypto::verify_signature(message, public_key, signature));

  signature[10] ^= 1;
  EXPECT_FALSE(vellum::crypto::verify_signature(golden_signable(), public_key,
                                                signature));
}

TEST(verify, rejects_wrong_shapes) {
  const auto signature =
      vellum::testing::hex(vellum::testing::kGoldenSignature);
  const auto short_signature =
      vellum::schema::bytes_t(signature.begin(), signature.end() - 1);
  EXPECT_FALSE(vellum::crypto::verify_signature(
      golden_signable(),
      vellum::testing::hex(vellum::testing::kEd25519PublicKeyDer),
      short_signature));
  EXPECT_FALSE(vellum::crypto::verify_signature(
      golden_signable(),
      vellum::testing::hex(vellum::testing::kSecp256k1PublicKeyDer),
      signature));
  EXPECT_FALSE(vellum::crypto::verify_signature(
      golden_signable(), vellum::testing::hex(kP256PublicKeyDer), signature));
}

TEST(verify, secp256k1_signature_from_the_signer) {
  const auto signer = vellum::testing::make_secp256k1_signer();
  auto id = vellum::schema::request_id_t{};
  id.fill(7);
  auto error = vellum::common::error{};
  auto signature = signer.sign(id, error);
  ASSERT_TRUE(signature.has_value()) << vellum::common::describe(error);
  EXPECT_TRUE(vellum::crypto::verify_signature(
      vellum::request::make_signable(id), signer.public_key(), *signature));
  EXPECT_FALSE(vellum::crypto::verify_signature(
      vellum::request::make_signable(id),
      vellum::testing::hex(vellum::testing::kEd25519PublicKeyDer),
      *signature));
}
