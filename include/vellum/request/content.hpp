#pragma once
#include <vellum/common/error.hpp>
#include <vellum/schema/call_type.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/schema/principal.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Schema type: request content.
// The signed part of an envelope, kept as a generic map so fields this tool
// does not model survive a deserialize and stay covered by the request id.
namespace vellum::request {

struct content_value_t;
struct content_field_t;

using content_array_t = std::vector<content_value_t>;
/// Keys are unique; order carries no meaning.
using content_map_t = std::vector<content_field_t>;

/// blob | text | nat | array | map. The IC content map carries no signed
/// integers; CBOR encodes every non-negative integer as a nat.
struct content_value_t final {
  std::variant<vellum::schema::bytes_t,
               std::string,
               uint64_t,
               content_array_t,
               content_map_t>
      value;

  bool operator==(const content_value_t&) const;
};

struct content_field_t final {
  std::string key;
  content_value_t value;

  bool operator==(const content_field_t&) const;
};

const content_value_t* find(const content_map_t& map, std::string_view key);

inline constexpr auto kIngressExpiryKey = std::string_view{"ingress_expiry"};

struct call_content_t final {
  vellum::schema::call_type_t call_type{vellum::schema::call_type_t::update};
  vellum::schema::principal_t canister_id;
  std::string method_name;
  vellum::schema::bytes_t arg;
  vellum::schema::principal_t sender;
  std::optional<vellum::schema::bytes_t> nonce;
  vellum::schema::timestamp_nanoseconds_t ingress_expiry{};

  bool operator==(const call_content_t&) const = default;
};

struct read_state_content_t final {
  vellum::schema::principal_t sender;
  std::vector<std::vector<vellum::schema::bytes_t>> paths;
  vellum::schema::timestamp_nanoseconds_t ingress_expiry{};

  bool operator==(const read_state_content_t&) const = default;
};

using request_content_t = std::variant<call_content_t, read_state_content_t>;

/// "call", "query" or "read_state".
std::string_view request_type(const request_content_t& content);

content_map_t to_content_map(const request_content_t& content);

/// Typed view of a content map. Unknown keys are ignored here; they remain in
/// the map the view was taken from.
std::optional<request_content_t> try_from_content_map(
    const content_map_t& map,
    vellum::common::error& error);

/// Paths of the read_state request polling the status of `request_id`.
std::vector<std::vector<vellum::schema::bytes_t>> request_status_paths(
    const vellum::schema::request_id_t& request_id);

}  // namespace vellum::request
