#include <gtest/gtest.h>
#include <vellum/crypto/verify.hpp>
#include <vellum/request/request_id.hpp>
#include <vellum/request/signing.hpp>
#include <vellum/testing/fixtures.hpp>

TEST(signing, golden_transfer_request) {
  auto signer = vellum::testing::make_ed25519_signer();
  auto error = vellum::common::error{};
  auto message = vellum::request::sign_call(
      signer, vellum::testing::make_golden_transfer(),
      vellum::testing::make_golden_metadata(), error);
  ASSERT_TRUE(message.has_value()) << vellum::common::describe(error);

  EXPECT_EQ(vellum::schema::to_hex(message->ingress.request_id),
            vellum::testing::kGoldenRequestId);
  EXPECT_EQ(vellum::schema::to_hex(message->ingress.envelope.sender_sig),
            vellum::testing::kGoldenSignature);
  EXPECT_EQ(vellum::schema::to_hex(
                vellum::request::serialize(message->ingress.envelope)),
            vellum::testing::kGoldenEnvelope);
}

TEST(signing, update_calls_come_with_a_status_request) {
  auto signer = vellum::testing::make_ed25519_signer();
  auto error = vellum::common::error{};
  auto message = vellum::request::sign_call(
      signer, vellum::testing::make_golden_transfer(),
      vellum::testing::make_golden_metadata(), error);
  ASSERT_TRUE(message.has_value()) << vellum::common::describe(error);
  ASSERT_TRUE(message->request_status.has_value());

  const auto& status = *message->request_status;
  EXPECT_EQ(vellum::schema::to_hex(status.request_id),
            vellum::testing::kGoldenStatusRequestId);
  auto content =
      vellum::request::try_from_content_map(status.envelope.content, error);
  ASSERT_TRUE(content.has_value()) << vellum::common::describe(error);
  const auto* read_state =
      std::get_if<vellum::request::read_state_content_t>(&*content);
  ASSERT_NE(read_state, nullptr);
  EXPECT_EQ(read_state->ingress_expiry, vellum::testing::kGoldenExpiry);
  EXPECT_EQ(read_state->paths,
            vellum::request::request_status_paths(message->ingress.request_id));
  EXPECT_TRUE(vellum::request::verify(status.envelope, error))
      << vellum::common::describe(error);
}

TEST(signing, queries_carry_no_nonce_and_no_status_request) {
  auto signer = vellum::testing::make_ed25519_signer();
  auto error = vellum::common::error{};
  auto call = vellum::request::build_account_balance(
      vellum::testing::kAnonymousAccount, error);
  ASSERT_TRUE(call.has_value()) << vellum::common::describe(error);

  auto metadata = vellum::request::make_call_metadata(
      call->call_type, vellum::testing::kGoldenExpiry, {}, error);
  ASSERT_TRUE(metadata.has_value()) << vellum::common::describe(error);
  EXPECT_FALSE(metadata->nonce.has_value());

  auto message = vellum::request::sign_call(signer, *call, *metadata, error);
  ASSERT_TRUE(message.has_value()) << vellum::common::describe(error);
  EXPECT_FALSE(message->request_status.has_value());
  EXPECT_EQ(vellum::request::find(message->ingress.envelope.content, "nonce"),
            nullptr);
}

TEST(signing, update_metadata_carries_a_fresh_nonce) {
  auto error = vellum::common::error{};
  auto first = vellum::request::make_call_metadata(
      vellum::schema::call_type_t::update, vellum::testing::kGoldenExpiry, {},
      error);
  auto second = vellum::request::make_call_metadata(
      vellum::schema::call_type_t::update, vellum::testing::kGoldenExpiry, {},
      error);
  ASSERT_TRUE(first.has_value() && second.has_value())
      << vellum::common::describe(error);
  ASSERT_TRUE(first->nonce.has_value());
  EXPECT_EQ(first->ingress_expiry, second->ingress_expiry);
  EXPECT_NE(first->nonce, second->nonce);
}

TEST(signing, signing_is_deterministic_for_fixed_metadata) {
  auto signer = vellum::testing::make_secp256k1_signer();
  auto call = vellum::testing::make_golden_transfer();
  auto metadata = vellum::testing::make_golden_metadata();
  auto error = vellum::common::error{};
  auto first = vellum::request::sign_call(signer, call, metadata, error);
  auto second = vellum::request::sign_call(signer, call, metadata, error);
  ASSERT_TRUE(first.has_value() && second.has_value())
      << vellum::common::describe(error);
  EXPECT_EQ(first->ingress.request_id, second->ingress.request_id);
  EXPECT_TRUE(vellum::crypto::verify_signature(
      vellum::request::make_signable(first->ingress.request_id),
      signer.public_key(), first->ingress.envelope.sender_sig));
}
