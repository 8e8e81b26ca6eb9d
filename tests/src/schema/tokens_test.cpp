#include <gtest/gtest.h>
#include <vellum/schema/tokens.hpp>

#include <limits>

namespace {

std::optional<uint64_t> parse(const std::string_view text) {
  auto error = vellum::common::error{};
  auto tokens = vellum::schema::try_parse_tokens(text, error);
  if (!tokens) {
    EXPECT_EQ(error.code, vellum::common::error_code::input);
    return std::nullopt;
  }
  return tokens->e8s;
}

}  // namespace

TEST(tokens, whole_and_fractional_amounts) {
  EXPECT_EQ(parse("0"), uint64_t{0});
  EXPECT_EQ(parse("3"), uint64_t{300'000'000});
  EXPECT_EQ(parse("2.5"), uint64_t{250'000'000});
  EXPECT_EQ(parse("0.0001"), uint64_t{10'000});
  EXPECT_EQ(parse("0.00000001"), uint64_t{1});
  EXPECT_EQ(parse("1_000"), uint64_t{100'000'000'000});
}

TEST(tokens, malformed_amounts_are_rejected) {
  EXPECT_FALSE(parse(""));
  EXPECT_FALSE(parse("."));
  EXPECT_FALSE(parse("1."));
  EXPECT_FALSE(parse(".5"));
  EXPECT_FALSE(parse("-1"));
  EXPECT_FALSE(parse("+1"));
  EXPECT_FALSE(parse("1.000000001"));
  EXPECT_FALSE(parse("1.2.3"));
  EXPECT_FALSE(parse("1e8"));
  EXPECT_FALSE(parse(" 1"));
  EXPECT_FALSE(parse("1__0"));
  EXPECT_FALSE(parse("_1"));
}

TEST(tokens, largest_representable_amount) {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  // 184467440737.09551615 tokens is exactly u64::MAX e8s.
  EXPECT_EQ(parse("184467440737.09551615"), kMax);
  EXPECT_FALSE(parse("184467440737.09551616"));
  EXPECT_FALSE(parse("184467440738"));

  auto error = vellum::common::error{};
  EXPECT_EQ(vellum::schema::try_parse_e8s("18446744073709551615", error)
                .value_or(vellum::schema::tokens_t{})
                .e8s,
            kMax);
  EXPECT_FALSE(vellum::schema::try_parse_e8s("18446744073709551616", error));
  EXPECT_EQ(error.code, vellum::common::error_code::input);
}

TEST(tokens, checked_arithmetic_reports_overflow) {
  auto error = vellum::common::error{};
  auto max = vellum::schema::tokens_t{
      .e8s = std::numeric_limits<uint64_t>::max()};
  EXPECT_FALSE(vellum::schema::checked_add(
      max, vellum::schema::tokens_t{.e8s = 1}, error));
  EXPECT_TRUE(vellum::schema::checked_add(
      max, vellum::schema::tokens_t{.e8s = 0}, error));
  EXPECT_FALSE(vellum::schema::checked_sub(
      vellum::schema::tokens_t{.e8s = 1}, vellum::schema::tokens_t{.e8s = 2},
      error));
  EXPECT_FALSE(vellum::schema::checked_from_whole_tokens(
      std::numeric_limits<uint64_t>::max() / 100, error));
}

TEST(tokens, to_string_drops_trailing_zeroes) {
  EXPECT_EQ(vellum::schema::to_string(vellum::schema::tokens_t{.e8s = 0}), "0");
  EXPECT_EQ(
      vellum::schema::to_string(vellum::schema::tokens_t{.e8s = 250'000'000}),
      "2.5");
  EXPECT_EQ(vellum::schema::to_string(vellum::schema::tokens_t{.e8s = 10'000}),
            "0.0001");
  EXPECT_EQ(vellum::schema::to_string(vellum::schema::tokens_t{.e8s = 1}),
            "0.00000001");
}
