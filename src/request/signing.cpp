#include <vellum/request/request_id.hpp>
#include <vellum/request/signing.hpp>

#include <spdlog/spdlog.h>

namespace vellum::request {

std::optional<call_metadata_t> make_call_metadata(
    const vellum::schema::call_type_t call_type,
    const vellum::schema::timestamp_nanoseconds_t now,
    const expiry_policy_t& policy,
    vellum::common::error& error) {
  auto expiry = compute_expiry(now, error, policy);
  if (!expiry) {
    return std::nullopt;
  }
  auto metadata = call_metadata_t{.ingress_expiry = *expiry};
  if (call_type == vellum::schema::call_type_t::update) {
    metadata.nonce = make_nonce(error);
    if (!metadata.nonce) {
      return std::nullopt;
    }
  }
  return metadata;
}

call_content_t make_call_content(const canister_call_t& call,
                                 const vellum::schema::principal_t& sender,
                                 const call_metadata_t& metadata) {
  return call_content_t{.call_type = call.call_type,
                        .canister_id = call.canister_id,
                        .method_name = call.method_name,
                        .arg = call.arg,
                        .sender = sender,
                        .nonce = metadata.nonce,
                        .ingress_expiry = metadata.ingress_expiry};
}

std::optional<signed_request_t> sign_content(
    const vellum::crypto::key_signer& signer,
    const request_content_t& content,
    vellum::common::error& error) {
  auto map = to_content_map(content);
  auto request_id = compute_request_id(map);
  auto signature = signer.sign(request_id, error);
  if (!signature) {
    return std::nullopt;
  }
  spdlog::debug("Signed {} request {}", request_type(content),
                vellum::schema::to_hex(request_id));
  return signed_request_t{
      .request_id = request_id,
      .envelope = seal(std::move(map), *signature, signer.public_key())};
}

std::optional<signed_message_t> sign_call(
    const vellum::crypto::key_signer& signer,
    const canister_call_t& call,
    const call_metadata_t& metadata,
    vellum::common::error& error) {
  auto ingress = sign_content(
      signer, make_call_content(call, signer.principal(), metadata), error);
  if (!ingress) {
    return std::nullopt;
  }
  auto message = signed_message_t{.call = call, .ingress = std::move(*ingress)};
  if (call.call_type == vellum::schema::call_type_t::query) {
    return message;
  }

  auto status = sign_content(
      signer,
      read_state_content_t{
          .sender = signer.principal(),
          .paths = request_status_paths(message.ingress.request_id),
          .ingress_expiry = metadata.ingress_expiry},
      error);
  if (!status) {
    return std::nullopt;
  }
  message.request_status = std::move(*status);
  return message;
}

}  // namespace vellum::request
