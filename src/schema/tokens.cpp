#include <vellum/schema/tokens.hpp>

#include <limits>

namespace vellum::schema {

namespace {

constexpr auto kCodespace = std::string_view{"vellum.tokens"};
constexpr auto kMaxFractionDigits = std::size_t{8};

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

std::optional<uint64_t> try_parse_u64(const std::string_view text,
                                      const std::string_view what,
                                      vellum::common::error& error) {
  if (text.empty() || !is_digit(text.front()) || !is_digit(text.back())) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         std::string{what} + " is not an unsigned integer",
                         std::string{text}, kCodespace);
    return std::nullopt;
  }
  auto value = uint64_t{0};
  auto previous_separator = false;
  for (const auto c : text) {
    if (c == '_') {
      if (previous_separator) {
        vellum::common::fail(error, vellum::common::error_code::input,
                             std::string{what} + " is not an unsigned integer",
                             std::string{text}, kCodespace);
        return std::nullopt;
      }
      previous_separator = true;
      continue;
    }
    previous_separator = false;
    if (!is_digit(c)) {
      vellum::common::fail(error, vellum::common::error_code::input,
                           std::string{what} + " is not an unsigned integer",
                           std::string{text}, kCodespace);
      return std::nullopt;
    }
    auto digit = static_cast<uint64_t>(c - '0');
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      vellum::common::fail(error, vellum::common::error_code::input,
                           std::string{what} + " overflows 64 bits",
                           std::string{text}, kCodespace);
      return std::nullopt;
    }
    value = (value * 10) + digit;
  }
  return value;
}

std::optional<tokens_t> try_parse_e8s(const std::string_view text,
                                      vellum::common::error& error) {
  auto value = try_parse_u64(text, "amount", error);
  if (!value) {
    return std::nullopt;
  }
  return tokens_t{.e8s = *value};
}

std::optional<tokens_t> try_parse_tokens(const std::string_view text,
                                         vellum::common::error& error) {
  auto dot = text.find('.');
  auto whole_text = text.substr(0, dot);
  auto whole = try_parse_u64(whole_text, "amount", error);
  if (!whole) {
    return std::nullopt;
  }

  auto fraction = uint64_t{0};
  if (dot != std::string_view::npos) {
    auto fraction_text = text.substr(dot + 1);
    if (fraction_text.empty() || fraction_text.size() > kMaxFractionDigits) {
      vellum::common::fail(error, vellum::common::error_code::input,
                           "amount must have 1 to 8 fractional digits",
                           std::string{text}, kCodespace);
      return std::nullopt;
    }
    for (const auto c : fraction_text) {
      if (!is_digit(c)) {
        vellum::common::fail(error, vellum::common::error_code::input,
                             "amount is not a decimal number",
                             std::string{text}, kCodespace);
        return std::nullopt;
      }
    }
    auto parsed = try_parse_u64(fraction_text, "amount", error);
    if (!parsed) {
      return std::nullopt;
    }
    fraction = *parsed;
    for (auto i = fraction_text.size(); i < kMaxFractionDigits; ++i) {
      fraction *= 10;
    }
  }

  auto base = checked_from_whole_tokens(*whole, error);
  if (!base) {
    return std::nullopt;
  }
  return checked_add(*base, tokens_t{.e8s = fraction}, error);
}

std::optional<tokens_t> checked_add(const tokens_t lhs,
                                    const tokens_t rhs,
                                    vellum::common::error& error) {
  if (lhs.e8s > std::numeric_limits<uint64_t>::max() - rhs.e8s) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "amount overflows 64 bits",
                         std::to_string(lhs.e8s) + " + " +
                             std::to_string(rhs.e8s),
                         kCodespace);
    return std::nullopt;
  }
  return tokens_t{.e8s = lhs.e8s + rhs.e8s};
}

std::optional<tokens_t> checked_sub(const tokens_t lhs,
                                    const tokens_t rhs,
                                    vellum::common::error& error) {
  if (rhs.e8s > lhs.e8s) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "amount underflows zero",
                         std::to_string(lhs.e8s) + " - " +
                             std::to_string(rhs.e8s),
                         kCodespace);
    return std::nullopt;
  }
  return tokens_t{.e8s = lhs.e8s - rhs.e8s};
}

std::optional<tokens_t> checked_from_whole_tokens(
    const uint64_t whole,
    vellum::common::error& error) {
  if (whole > std::numeric_limits<uint64_t>::max() / kE8sPerToken) {
    vellum::common::fail(error, vellum::common::error_code::input,
                         "amount overflows 64 bits", std::to_string(whole),
                         kCodespace);
    return std::nullopt;
  }
  return tokens_t{.e8s = whole * kE8sPerToken};
}

std::string to_string(const tokens_t value) {
  auto out = std::to_string(value.e8s / kE8sPerToken);
  auto fraction = value.e8s % kE8sPerToken;
  if (fraction == 0) {
    return out;
  }
  auto digits = std::to_string(fraction);
  digits.insert(0, kMaxFractionDigits - digits.size(), '0');
  while (!digits.empty() && digits.back() == '0') {
    digits.pop_back();
  }
  out.push_back('.');
  out += digits;
  return out;
}

}  // namespace vellum::schema
