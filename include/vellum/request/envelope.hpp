#pragma once
#include <vellum/common/error.hpp>
#include <vellum/request/content.hpp>
#include <vellum/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: envelope.
// Authenticated request: the content map with the public key that signed it
// and the signature over its request id.
namespace vellum::request {

/// CBOR self-describe tag 55799.
inline constexpr auto kSelfDescribeTag =
    std::array<uint8_t, 3>{0xd9, 0xd9, 0xf7};

struct envelope_t final {
  content_map_t content;
  vellum::schema::bytes_t sender_pubkey;
  vellum::schema::bytes_t sender_sig;

  bool operator==(const envelope_t&) const = default;
};

envelope_t seal(content_map_t content,
                const vellum::schema::signature_t& signature,
                const vellum::schema::bytes_t& public_key);

/// Self-describe tag followed by the CBOR map
/// {content, sender_pubkey, sender_sig}.
vellum::schema::bytes_t serialize(const envelope_t& envelope);

/// All or nothing: the whole input must be one envelope whose content is a
/// well formed call, query or read_state. Unknown top-level keys are dropped;
/// unknown content fields are kept. The self-describe tag is optional.
std::optional<envelope_t> deserialize(const vellum::schema::bytes_view_t& bytes,
                                      vellum::common::error& error);

vellum::schema::request_id_t request_id(const envelope_t& envelope);

/// Recomputes the request id, checks the signature against the sender public
/// key and that the sender principal is the one the key authenticates.
bool verify(const envelope_t& envelope, vellum::common::error& error);

/// Multi-line description for a human reviewing what was signed. Fails only
/// when the content is not a call, query or read_state.
std::optional<std::string> render_human(const envelope_t& envelope,
                                        vellum::common::error& error);

}  // namespace vellum::request
