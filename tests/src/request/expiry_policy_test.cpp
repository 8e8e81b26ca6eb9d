#include <gtest/gtest.h>
#include <vellum/request/expiry_policy.hpp>

#include <limits>

namespace {

constexpr auto kNow = uint64_t{1'700'000'000'000'000'000};
constexpr auto kSecond = uint64_t{1'000'000'000};

}  // namespace

TEST(expiry_policy, default_expiry_is_four_minutes_ahead) {
  auto error = vellum::common::error{};
  auto expiry = vellum::request::compute_expiry(kNow, error);
  ASSERT_TRUE(expiry.has_value()) << vellum::common::describe(error);
  EXPECT_EQ(*expiry, kNow + (240 * kSecond));
  EXPECT_TRUE(vellum::request::validate_expiry(*expiry, kNow));
}

TEST(expiry_policy, validation_window_bounds) {
  EXPECT_FALSE(vellum::request::validate_expiry(kNow, kNow));
  EXPECT_FALSE(vellum::request::validate_expiry(kNow - 1, kNow));
  EXPECT_TRUE(vellum::request::validate_expiry(kNow + 1, kNow));
  EXPECT_TRUE(vellum::request::validate_expiry(kNow + (300 * kSecond), kNow));
  EXPECT_FALSE(
      vellum::request::validate_expiry(kNow + (300 * kSecond) + 1, kNow));
}

TEST(expiry_policy, custom_offset_within_the_window) {
  auto error = vellum::common::error{};
  auto policy =
      vellum::request::with_expiry_offset(std::chrono::seconds{60}, error);
  ASSERT_TRUE(policy.has_value()) << vellum::common::describe(error);
  EXPECT_EQ(vellum::request::compute_expiry(kNow, error, *policy),
            kNow + (60 * kSecond));

  EXPECT_TRUE(
      vellum::request::with_expiry_offset(std::chrono::seconds{300}, error));
  EXPECT_FALSE(
      vellum::request::with_expiry_offset(std::chrono::seconds{301}, error));
  EXPECT_EQ(error.code, vellum::common::error_code::input);
  EXPECT_FALSE(
      vellum::request::with_expiry_offset(std::chrono::seconds{0}, error));
  EXPECT_FALSE(
      vellum::request::with_expiry_offset(std::chrono::seconds{-5}, error));
}

TEST(expiry_policy, overflowing_expiry_is_rejected) {
  auto error = vellum::common::error{};
  EXPECT_FALSE(vellum::request::compute_expiry(
      std::numeric_limits<uint64_t>::max() - 1, error));
  EXPECT_EQ(error.code, vellum::common::error_code::input);
}

TEST(expiry_policy, system_clock_is_after_2020) {
  EXPECT_GT(vellum::request::now_nanoseconds(),
            uint64_t{1'577'836'800} * kSecond);
}

TEST(expiry_policy, nonces_are_32_fresh_bytes) {
  auto error = vellum::common::error{};
  auto first = vellum::request::make_nonce(error);
  auto second = vellum::request::make_nonce(error);
  ASSERT_TRUE(first.has_value()) << vellum::common::describe(error);
  ASSERT_TRUE(second.has_value()) << vellum::common::describe(error);
  EXPECT_EQ(first->size(), vellum::request::kNonceSize);
  EXPECT_NE(*first, *second);
}
