#pragma once
#include <vellum/request/content.hpp>
#include <vellum/schema/primitives.hpp>

#include <string_view>

namespace vellum::request {

/// Domain separator prepended to a request id before it is signed.
inline constexpr auto kRequestDomainSeparator =
    std::string_view{"\x0A" "ic-request"};

/// Representation independent hash of a content map: the sha256 of the
/// sorted concatenation of sha256(key) || hash(value) over all fields.
vellum::schema::request_id_t compute_request_id(const content_map_t& content);
vellum::schema::request_id_t compute_request_id(
    const request_content_t& content);

/// `kRequestDomainSeparator || request_id`, the bytes a key signs.
vellum::schema::bytes_t make_signable(
    const vellum::schema::request_id_t& request_id);

}  // namespace vellum::request
