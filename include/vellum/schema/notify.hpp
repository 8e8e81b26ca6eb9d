#pragma once
#include <vellum/schema/account_identifier.hpp>
#include <vellum/schema/principal.hpp>
#include <vellum/schema/tokens.hpp>

#include <cstdint>
#include <optional>

// Schema type: notify.
// Ledger notification: tells `to_canister` about the transfer recorded at
// `block_height`, paying at most `max_fee`.
namespace vellum::schema {

struct notify_t final {
  uint64_t block_height{};
  tokens_t max_fee{.e8s = kDefaultTransactionFee};
  std::optional<subaccount_t> from_subaccount;
  principal_t to_canister;
  std::optional<subaccount_t> to_subaccount;

  bool operator==(const notify_t&) const = default;
};

}  // namespace vellum::schema
