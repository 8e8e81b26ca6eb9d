#pragma once
#include <vellum/common/error.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/schema/principal.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: account identifier.
// Ledger address: crc32 checksum followed by the sha224 of the owning
// principal and one of its 32-byte subaccounts.
namespace vellum::schema {

using subaccount_t = std::array<uint8_t, 32>;

struct account_identifier_t final {
  std::array<uint8_t, 32> bytes{};

  bool operator==(const account_identifier_t&) const = default;
};

account_identifier_t derive_account_identifier(
    const principal_t& principal,
    const std::optional<subaccount_t>& subaccount = std::nullopt);

/// 64 lower-case hex characters.
std::string to_text(const account_identifier_t& account);

/// True when `text` is 64 hex characters whose leading four bytes are the
/// big-endian crc32 of the remaining 28.
bool validate_account_identifier(std::string_view text);

std::optional<account_identifier_t> try_parse_account_identifier(
    std::string_view text,
    vellum::common::error& error);

/// A subaccount is exactly 32 bytes; other lengths are rejected, never
/// padded or truncated.
std::optional<subaccount_t> try_make_subaccount(const bytes_view_t& bytes,
                                                vellum::common::error& error);
std::optional<subaccount_t> try_parse_subaccount(std::string_view hex,
                                                 vellum::common::error& error);

/// Subaccount of the governance canister that funds the neuron identified by
/// (controller, nonce).
subaccount_t make_neuron_staking_subaccount(const principal_t& controller,
                                            uint64_t nonce);

}  // namespace vellum::schema
