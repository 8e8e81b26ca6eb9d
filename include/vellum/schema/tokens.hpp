#pragma once
#include <vellum/common/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: tokens.
// Ledger amount counted in e8s, the smallest indivisible unit
// (1 token = 100_000_000 e8s).
namespace vellum::schema {

inline constexpr auto kE8sPerToken = uint64_t{100'000'000};
inline constexpr auto kDefaultTransactionFee = uint64_t{10'000};

struct tokens_t final {
  uint64_t e8s{};

  bool operator==(const tokens_t&) const = default;
};

/// Human amount: "N" or "N.F" with at most eight fractional digits.
std::optional<tokens_t> try_parse_tokens(std::string_view text,
                                         vellum::common::error& error);

/// Raw e8s count as a plain decimal string.
std::optional<tokens_t> try_parse_e8s(std::string_view text,
                                      vellum::common::error& error);

/// Strict unsigned decimal: digits only, optional '_' separators between
/// digits, no sign, no blanks.
std::optional<uint64_t> try_parse_u64(std::string_view text,
                                      std::string_view what,
                                      vellum::common::error& error);

std::optional<tokens_t> checked_add(tokens_t lhs,
                                    tokens_t rhs,
                                    vellum::common::error& error);
std::optional<tokens_t> checked_sub(tokens_t lhs,
                                    tokens_t rhs,
                                    vellum::common::error& error);
std::optional<tokens_t> checked_from_whole_tokens(uint64_t whole,
                                                  vellum::common::error& error);

/// "2.5", "0.0001", "3": fractional trailing zeros are dropped.
std::string to_string(tokens_t value);

}  // namespace vellum::schema
