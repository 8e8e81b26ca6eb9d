#pragma once
#include <vellum/common/error.hpp>
#include <vellum/request/envelope.hpp>
#include <vellum/request/signing.hpp>
#include <vellum/schema/call_type.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Message file: the JSON bundle carried from the offline signer to the online
// submitter. Update calls are written as
//   {"ingress": {"call_type", "request_id", "content"},
//    "request_status": {"canister_id", "request_id", "content"}}
// and queries as {"call_type", "request_id": null, "content"}, where
// `content` is the hex of the serialized envelope.
namespace vellum::request {

struct message_entry_t final {
  vellum::schema::call_type_t call_type{vellum::schema::call_type_t::update};
  std::optional<vellum::schema::request_id_t> request_id;
  envelope_t ingress;
  std::optional<envelope_t> request_status;
};

std::string write_message_file(const std::vector<signed_message_t>& messages);

/// Accepts an array of entries or a single entry. Every envelope is
/// deserialized and every stated request id must match its envelope.
std::optional<std::vector<message_entry_t>> parse_message_file(
    std::string_view text,
    vellum::common::error& error);

}  // namespace vellum::request
