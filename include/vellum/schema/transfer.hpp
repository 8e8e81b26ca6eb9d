#pragma once
#include <vellum/schema/account_identifier.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/schema/tokens.hpp>

#include <cstdint>
#include <optional>

// Schema type: transfer.
// Ledger send: moves `amount` from a subaccount of the signer to `to`,
// burning `fee`.
namespace vellum::schema {

struct transfer_t final {
  uint64_t memo{};
  tokens_t amount;
  tokens_t fee{.e8s = kDefaultTransactionFee};
  std::optional<subaccount_t> from_subaccount;
  account_identifier_t to;
  std::optional<timestamp_nanoseconds_t> created_at_time;

  bool operator==(const transfer_t&) const = default;
};

}  // namespace vellum::schema
