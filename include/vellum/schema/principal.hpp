#pragma once
#include <vellum/common/error.hpp>
#include <vellum/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

// Schema type: principal.
// Identity of a caller or a canister. Canister ids, the sender of a request
// and neuron controllers are all principals.
namespace vellum::schema {

inline constexpr auto kMaxPrincipalLength = std::size_t{29};
inline constexpr auto kSelfAuthenticatingSuffix = uint8_t{0x02};
inline constexpr auto kAnonymousSuffix = uint8_t{0x04};

struct principal_t final {
  bytes_t bytes;

  bool operator==(const principal_t&) const = default;
};

/// `sha224(der_public_key) || 0x02`.
principal_t make_self_authenticating_principal(
    const bytes_view_t& der_public_key);
principal_t make_anonymous_principal();
principal_t make_canister_principal(uint64_t canister_index);

std::optional<principal_t> try_make_principal(const bytes_view_t& bytes,
                                              vellum::common::error& error);

/// Textual form: base32(crc32_be(bytes) || bytes), lower case, in dash
/// separated groups of five characters.
std::string to_text(const principal_t& principal);
std::optional<principal_t> try_parse_principal(std::string_view text,
                                               vellum::common::error& error);

/// Well known NNS canisters.
principal_t ledger_canister_id();
principal_t governance_canister_id();

}  // namespace vellum::schema
