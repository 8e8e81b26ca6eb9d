#pragma once
#include <vellum/schema/account_identifier.hpp>

// Schema type: account balance.
// Ledger query for the balance of one account.
namespace vellum::schema {

struct account_balance_t final {
  account_identifier_t account;

  bool operator==(const account_balance_t&) const = default;
};

}  // namespace vellum::schema
