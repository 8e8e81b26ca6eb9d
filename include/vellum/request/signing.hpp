#pragma once
#include <vellum/common/error.hpp>
#include <vellum/crypto/key_signer.hpp>
#include <vellum/request/builder.hpp>
#include <vellum/request/content.hpp>
#include <vellum/request/envelope.hpp>
#include <vellum/request/expiry_policy.hpp>

#include <optional>

// Signing pipeline: call -> content -> request id -> signature -> envelope.
namespace vellum::request {

/// Per-call replay protection. Update calls carry a nonce; queries do not.
struct call_metadata_t final {
  vellum::schema::timestamp_nanoseconds_t ingress_expiry{};
  std::optional<vellum::schema::bytes_t> nonce;
};

std::optional<call_metadata_t> make_call_metadata(
    vellum::schema::call_type_t call_type,
    vellum::schema::timestamp_nanoseconds_t now,
    const expiry_policy_t& policy,
    vellum::common::error& error);

call_content_t make_call_content(const canister_call_t& call,
                                 const vellum::schema::principal_t& sender,
                                 const call_metadata_t& metadata);

struct signed_request_t final {
  vellum::schema::request_id_t request_id{};
  envelope_t envelope;
};

struct signed_message_t final {
  canister_call_t call;
  signed_request_t ingress;
  /// read_state polling the status of `ingress`, signed up front so the
  /// online side never needs the key. Update calls only.
  std::optional<signed_request_t> request_status;
};

std::optional<signed_request_t> sign_content(
    const vellum::crypto::key_signer& signer,
    const request_content_t& content,
    vellum::common::error& error);

std::optional<signed_message_t> sign_call(
    const vellum::crypto::key_signer& signer,
    const canister_call_t& call,
    const call_metadata_t& metadata,
    vellum::common::error& error);

}  // namespace vellum::request
